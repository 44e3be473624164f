#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <xml2json/xml2json.hpp>

using namespace xml2json;

namespace {

    Node make_wide_tree(const std::size_t items) {
        Node root;
        Node& osm = root.add_child("osm");
        osm.add_attribute("version", "0.6");
        osm.add_attribute("generator", "CGImap 0.0.2");

        for (std::size_t i = 0; i < items; ++i) {
            Node& node = osm.add_child("node");
            node.add_attribute("id", std::to_string(i));
            node.add_attribute("lat", "51.5073");
            node.add_attribute("lon", "-0.1276");
            node.add_attribute("user", "mapper & <co>");
            node.add_child("tag").add_attribute("v", "value " + std::to_string(i * 3));
        }
        return root;
    }

    Node make_deep_tree(const int depth) {
        Node root = Node::leaf("bottom");
        for (int i = 0; i < depth; ++i) {
            Node parent;
            parent.data = "level";
            parent.add_child("child", std::move(root));
            root = std::move(parent);
        }
        return root;
    }

    std::string make_text(const std::size_t n) {
        std::string s;
        s.reserve(n * 16);
        for (std::size_t i = 0; i < n; ++i) {
            s += "plain words ";
            if (i % 8 == 0)
                s += "<tag attr=\"v\"> & ";
            if (i % 16 == 0)
                s += "\xC3\xA9\xE2\x80\xA8\n";
        }
        return s;
    }

} // namespace

TEST_CASE("xml2json sanitize benchmark", "[xml2json][bench]") {
    const std::string ascii(1 << 16, 'a');
    const std::string text = make_text(4000);

    BENCHMARK("sanitize plain ascii (64KB)") {
        return sanitize(ascii).size();
    };

    BENCHMARK("sanitize mixed text") {
        return sanitize(text).size();
    };
}

TEST_CASE("xml2json encode benchmark", "[xml2json][bench]") {
    const Node wide = make_wide_tree(2000);
    const Node deep = make_deep_tree(200);

    BENCHMARK("encode wide tree (2000 nodes)") {
        return encode(wide).size();
    };

    BENCHMARK("encode wide tree indented") {
        Options opt;
        opt.indent = true;
        opt.indent_text = "  ";
        return encode(wide, opt).size();
    };

    BENCHMARK("encode deep tree (200 levels)") {
        return encode(deep).size();
    };

    BENCHMARK("encode wide tree to stream") {
        std::ostringstream os;
        const EncodeError err = encode(&wide, os);
        REQUIRE(err.ok());
        return os.str().size();
    };
}
