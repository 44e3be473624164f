/*
 * xml2json
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef XML2JSON_HPP
#define XML2JSON_HPP

#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#ifdef _MSC_VER
    #define XML2JSON_FORCEINLINE __forceinline
#else
    #define XML2JSON_FORCEINLINE __attribute__((always_inline)) inline
#endif

namespace xml2json {

    inline constexpr std::string_view kDefaultContentPrefix {};
    inline constexpr std::string_view kDefaultAttributePrefix {"-"};
    inline constexpr std::string_view kContentKey {"content"};

} // namespace xml2json

namespace xml2json::detail {

    struct CharMask256 {
        std::uint64_t w[4] {};

        // bytes that end a verbatim run: ASCII that must be escaped and every non-ASCII byte
        static consteval CharMask256 make_special() {
            CharMask256 m {};

            auto set = [&](const unsigned c) {
                m.w[c >> 6] |= 1ull << (c & 63);
            };

            for (unsigned c = 0; c < 0x20; ++c)
                set(c);

            set('"');
            set('\\');
            set('<');
            set('>');
            set('&');

            for (unsigned c = 0x80; c < 0x100; ++c)
                set(c);

            return m;
        }

        [[nodiscard]] static constexpr bool test(const CharMask256& m, const unsigned char c) noexcept {
            return (m.w[c >> 6] >> (c & 63) & 1ull) != 0;
        }
    };

    inline constexpr CharMask256 kSpecialMask = CharMask256::make_special();

    inline constexpr char kHexDigits[] = "0123456789abcdef";

    [[nodiscard]] XML2JSON_FORCEINLINE constexpr bool has_zero_byte_u64(const std::uint64_t v) noexcept {
        return (v - 0x0101010101010101ull & ~v & 0x8080808080808080ull) != 0;
    }

    [[nodiscard]] XML2JSON_FORCEINLINE constexpr bool is_cont(const unsigned char c) noexcept {
        return (c & 0xC0u) == 0x80u;
    }

    [[nodiscard]] XML2JSON_FORCEINLINE const char* find_special_in_string(const char* p, const char* e) noexcept {
        const char* it = p;

        while (it + 8 <= e) {
            constexpr auto kQuote = 0x2222222222222222ull;
            constexpr auto kBSlash = 0x5C5C5C5C5C5C5C5Cull;
            constexpr auto kLess = 0x3C3C3C3C3C3C3C3Cull;
            constexpr auto kGreater = 0x3E3E3E3E3E3E3E3Eull;
            constexpr auto kAmp = 0x2626262626262626ull;
            constexpr auto kE0 = 0xE0E0E0E0E0E0E0E0ull;
            constexpr auto kHigh = 0x8080808080808080ull;

            std::uint64_t x;
            std::memcpy(&x, it, 8);

            const bool hit = (x & kHigh) != 0 || has_zero_byte_u64(x & kE0) || has_zero_byte_u64(x ^ kQuote) ||
                has_zero_byte_u64(x ^ kBSlash) || has_zero_byte_u64(x ^ kLess) || has_zero_byte_u64(x ^ kGreater) ||
                has_zero_byte_u64(x ^ kAmp);

            if (hit) {
                for (auto i = 0; i < 8; ++i) {
                    const auto c = static_cast<unsigned char>(it[i]);
                    if (CharMask256::test(kSpecialMask, c))
                        return it + i;
                }
            }
            it += 8;
        }

        while (it < e) {
            const auto c = static_cast<unsigned char>(*it);
            if (CharMask256::test(kSpecialMask, c))
                return it;
            ++it;
        }

        return e;
    }

    // Length of the well-formed UTF-8 sequence at p, or 0 when p does not start one.
    [[nodiscard]] XML2JSON_FORCEINLINE std::size_t decode_utf8(const char* p, const char* e, std::uint32_t& cp) noexcept {
        const auto c = static_cast<unsigned char>(*p);

        if (c < 0x80u) {
            cp = c;
            return 1;
        }

        // 2-byte
        if ((c >> 5) == 0x6) {
            if (e - p < 2)
                return 0;

            const auto c1 = static_cast<unsigned char>(p[1]);
            if (!is_cont(c1))
                return 0;

            cp = (c & 0x1Fu) << 6 | (c1 & 0x3Fu);
            return cp < 0x80u ? 0 : 2;
        }

        // 3-byte
        if ((c >> 4) == 0xE) {
            if (e - p < 3)
                return 0;

            const auto c1 = static_cast<unsigned char>(p[1]);
            const auto c2 = static_cast<unsigned char>(p[2]);
            if (!is_cont(c1) || !is_cont(c2))
                return 0;

            cp = (c & 0x0Fu) << 12 | (c1 & 0x3Fu) << 6 | (c2 & 0x3Fu);
            if (cp < 0x800u)
                return 0;
            if (cp >= 0xD800u && cp <= 0xDFFFu)
                return 0;
            return 3;
        }

        // 4-byte
        if ((c >> 3) == 0x1E) {
            if (e - p < 4)
                return 0;

            const auto c1 = static_cast<unsigned char>(p[1]);
            const auto c2 = static_cast<unsigned char>(p[2]);
            const auto c3 = static_cast<unsigned char>(p[3]);
            if (!is_cont(c1) || !is_cont(c2) || !is_cont(c3))
                return 0;

            cp = (c & 0x07u) << 18 | (c1 & 0x3Fu) << 12 | (c2 & 0x3Fu) << 6 | (c3 & 0x3Fu);
            if (cp < 0x10000u || cp > 0x10FFFFu)
                return 0;
            return 4;
        }

        return 0;
    }

    template <class Sink>
    [[nodiscard]] bool write_escaped_ascii(Sink& sink, const unsigned char c) {
        switch (c) {
        case '"': // NOLINT(bugprone-branch-clone)
            return sink.puts(std::string_view {"\\\""});
        case '\\':
            return sink.puts(std::string_view {"\\\\"});
        case '\n':
            return sink.puts(std::string_view {"\\n"});
        case '\r':
            return sink.puts(std::string_view {"\\r"});
        case '\t':
            return sink.puts(std::string_view {"\\t"});
        default: {
            // remaining control bytes plus <, > and &, which break HTML/script embedding
            char tmp[6];
            tmp[0] = '\\';
            tmp[1] = 'u';
            tmp[2] = '0';
            tmp[3] = '0';
            tmp[4] = kHexDigits[(c >> 4) & 0xF];
            tmp[5] = kHexDigits[c & 0xF];
            return sink.puts(std::string_view {tmp, 6});
        }
        }
    }

    template <class Sink>
    [[nodiscard]] bool write_sanitized(Sink& sink, const std::string_view s) {
        if (!sink.put('"'))
            return false;

        const char* p = s.data();
        const char* e = p + s.size();

        while (p < e) {
            if (const char* q = find_special_in_string(p, e); q > p) {
                if (!sink.puts(std::string_view {p, static_cast<std::size_t>(q - p)}))
                    return false;
                p = q;
                if (p >= e)
                    break;
            }

            const auto c = static_cast<unsigned char>(*p);

            if (c < 0x80u) {
                if (!write_escaped_ascii(sink, c))
                    return false;
                ++p;
                continue;
            }

            std::uint32_t cp {};
            const std::size_t n = decode_utf8(p, e, cp);

            if (n == 0) {
                if (!sink.puts(std::string_view {"\\ufffd"}))
                    return false;
                ++p;
                continue;
            }

            // U+2028 and U+2029 are legal JSON but terminate a JavaScript string literal
            if (cp == 0x2028u || cp == 0x2029u) {
                if (!sink.puts(cp == 0x2028u ? std::string_view {"\\u2028"} : std::string_view {"\\u2029"}))
                    return false;
            } else if (!sink.puts(std::string_view {p, n})) {
                return false;
            }
            p += n;
        }

        return sink.put('"');
    }

} // namespace xml2json::detail

namespace xml2json {

    struct Node {
        using Nodes = std::vector<Node>;
        using Children = std::unordered_map<std::string, Nodes>;

        std::string data;
        Children children;

        [[nodiscard]] static Node leaf(std::string text) {
            Node n;
            n.data = std::move(text);
            return n;
        }

        [[nodiscard]] bool has_children() const noexcept {
            return !children.empty();
        }

        // The returned reference is invalidated by the next add under the same label.
        Node& add_child(const std::string_view label, Node child = {}) {
            auto& seq = children[std::string {label}];
            seq.push_back(std::move(child));
            return seq.back();
        }

        Node& add_attribute(const std::string_view name, std::string value, const std::string_view prefix = kDefaultAttributePrefix) {
            std::string label;
            label.reserve(prefix.size() + name.size());
            label.append(prefix);
            label.append(name);
            return add_child(label, leaf(std::move(value)));
        }
    };

    enum class ErrorCode : std::uint8_t {
        None,
        WriteFailed,
    };

    [[nodiscard]] constexpr const char* error_code_name(const ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::WriteFailed:
            return "WriteFailed";
        }
        return "Unknown";
    }

    struct EncodeError {
        ErrorCode code {ErrorCode::None};
        std::size_t offset {}; // bytes accepted by the sink before the failing write

        XML2JSON_FORCEINLINE void set(const ErrorCode c, const std::size_t at = 0) noexcept {
            if (code == ErrorCode::None) {
                code = c;
                offset = at;
            }
        }

        XML2JSON_FORCEINLINE void reset() noexcept {
            code = ErrorCode::None;
            offset = 0;
        }

        [[nodiscard]] std::string to_string() const {
            return error_code_name(code);
        }

        [[nodiscard]] XML2JSON_FORCEINLINE constexpr bool ok() const noexcept {
            return code == ErrorCode::None;
        }

        [[nodiscard]] XML2JSON_FORCEINLINE constexpr explicit operator bool() const noexcept {
            return ok();
        }
    };

    [[nodiscard]] inline std::string format_error(const EncodeError& e) {
        if (e.ok())
            return {};

        std::string out;
        out.reserve(48);
        out.append("xml2json: ");
        out.append(error_code_name(e.code));
        out.append(" at offset ");
        out.append(std::to_string(e.offset));
        return out;
    }

    struct Options {
        std::string content_prefix {kDefaultContentPrefix};
        std::string attribute_prefix {kDefaultAttributePrefix};
        bool indent = false;
        std::string indent_text {};
        // Compact output only: false drops the newline written before each closing brace.
        bool newline_before_close = true;
    };

    struct FixedBufferSink {
        char* buf {};
        std::size_t cap {};
        std::size_t pos {};

        [[nodiscard]] XML2JSON_FORCEINLINE bool put(const char c) {
            if (pos >= cap)
                return false;
            buf[pos++] = c;
            return true;
        }

        [[nodiscard]] XML2JSON_FORCEINLINE bool puts(const std::string_view s) {
            if (pos + s.size() > cap)
                return false;
            std::memcpy(buf + pos, s.data(), s.size());
            pos += s.size();
            return true;
        }

        [[nodiscard]] XML2JSON_FORCEINLINE bool puts(const char* s) {
            return puts(std::string_view {s});
        }

        [[nodiscard]] XML2JSON_FORCEINLINE std::string_view finish() const {
            return {buf, pos};
        }
    };

    struct StringSink {
        std::string out;

        [[nodiscard]] XML2JSON_FORCEINLINE bool put(const char c) {
            out.push_back(c);
            return true;
        }
        [[nodiscard]] XML2JSON_FORCEINLINE bool puts(const std::string_view s) {
            out.append(s);
            return true;
        }
        [[nodiscard]] XML2JSON_FORCEINLINE bool puts(const char* s) {
            out.append(s);
            return true;
        }

        [[nodiscard]] XML2JSON_FORCEINLINE std::string finish() {
            return std::move(out);
        }
    };

    struct StreamSink {
        std::ostream* os {};

        [[nodiscard]] XML2JSON_FORCEINLINE bool put(const char c) {
            if (!os || !os->good())
                return false;
            os->put(c);
            return os->good();
        }

        [[nodiscard]] XML2JSON_FORCEINLINE bool puts(const std::string_view s) {
            if (!os || !os->good())
                return false;
            os->write(s.data(), static_cast<std::streamsize>(s.size()));
            return os->good();
        }

        [[nodiscard]] XML2JSON_FORCEINLINE bool puts(const char* s) {
            return puts(std::string_view {s});
        }

        [[nodiscard]] bool finish() {
            if (!os)
                return false;
            os->flush();
            return os->good();
        }
    };

    template <class Sink>
    class EncoderCore {
    public:
        explicit EncoderCore(Sink sink, Options opt = {}): sink_(std::move(sink)), opt_(std::move(opt)) { }

        EncoderCore& set_attribute_prefix(const std::string_view prefix) {
            opt_.attribute_prefix.assign(prefix);
            return *this;
        }

        EncoderCore& set_content_prefix(const std::string_view prefix) {
            opt_.content_prefix.assign(prefix);
            return *this;
        }

        EncoderCore& set_indent(const std::string_view text) {
            opt_.indent = true;
            opt_.indent_text.assign(text);
            return *this;
        }

        EncoderCore& set_newline_before_close(const bool enabled) {
            opt_.newline_before_close = enabled;
            return *this;
        }

        // Writes one JSON value and a trailing newline. The first write failure is kept
        // and every later call returns false without touching the sink.
        [[nodiscard]] bool encode(const Node* root) {
            if (!err_.ok())
                return false;
            if (!root)
                return true;

            if (!write_node(*root, 0))
                return false;

            return put('\n');
        }

        [[nodiscard]] bool encode_with_custom_prefixes(const Node* root, const std::string_view content_prefix, const std::string_view attribute_prefix) {
            std::string saved_content = std::exchange(opt_.content_prefix, std::string {content_prefix});
            std::string saved_attribute = std::exchange(opt_.attribute_prefix, std::string {attribute_prefix});

            const bool res = encode(root);

            opt_.content_prefix = std::move(saved_content);
            opt_.attribute_prefix = std::move(saved_attribute);
            return res;
        }

        [[nodiscard]] XML2JSON_FORCEINLINE bool ok() const noexcept {
            return err_.ok();
        }

        [[nodiscard]] XML2JSON_FORCEINLINE const EncodeError& error() const noexcept {
            return err_;
        }

        [[nodiscard]] XML2JSON_FORCEINLINE const Options& options() const noexcept {
            return opt_;
        }

        [[nodiscard]] XML2JSON_FORCEINLINE std::size_t bytes_written() const noexcept {
            return written_;
        }

        [[nodiscard]] XML2JSON_FORCEINLINE auto finish() {
            return sink_.finish();
        }

    private:
        using Entry = Node::Children::value_type;

        struct Out {
            EncoderCore* self {};

            [[nodiscard]] XML2JSON_FORCEINLINE bool put(const char c) const {
                return self->put(c);
            }
            [[nodiscard]] XML2JSON_FORCEINLINE bool puts(const std::string_view s) const {
                return self->puts(s);
            }
        };

        [[nodiscard]] XML2JSON_FORCEINLINE bool fail_write() noexcept {
            err_.set(ErrorCode::WriteFailed, written_);
            return false;
        }

        [[nodiscard]] XML2JSON_FORCEINLINE bool put(const char c) {
            if (!err_.ok())
                return false;
            if (!sink_.put(c))
                return fail_write();
            ++written_;
            return true;
        }

        [[nodiscard]] XML2JSON_FORCEINLINE bool puts(const std::string_view s) {
            if (!err_.ok())
                return false;
            if (!sink_.puts(s))
                return fail_write();
            written_ += s.size();
            return true;
        }

        [[nodiscard]] bool indent(const std::size_t lvl) {
            if (!opt_.indent)
                return true;

            for (std::size_t i = 0; i < lvl; ++i) {
                if (!puts(opt_.indent_text))
                    return false;
            }
            return true;
        }

        [[nodiscard]] XML2JSON_FORCEINLINE std::string_view separator() const noexcept {
            return opt_.indent ? std::string_view {",\n"} : std::string_view {", "};
        }

        [[nodiscard]] XML2JSON_FORCEINLINE bool write_string(const std::string_view s) {
            Out out {this};
            return detail::write_sanitized(out, s);
        }

        [[nodiscard]] bool write_key(const std::string_view key) {
            if (!write_string(key))
                return false;
            return puts(": ");
        }

        [[nodiscard]] static std::vector<const Entry*> sorted_entries(const Node& n) {
            std::vector<const Entry*> entries;
            entries.reserve(n.children.size());
            for (const auto& kv : n.children)
                entries.push_back(&kv);

            if (entries.size() > 1) {
                std::sort(entries.begin(), entries.end(), [](const Entry* a, const Entry* b) {
                    return a->first < b->first;
                });
            }
            return entries;
        }

        [[nodiscard]] bool write_array(const Node::Nodes& kids, const std::size_t lvl) {
            if (!put('['))
                return false;

            for (std::size_t i = 0; i < kids.size(); ++i) {
                if (i && !puts(", "))
                    return false;
                if (!write_node(kids[i], lvl))
                    return false;
            }

            return put(']');
        }

        [[nodiscard]] bool write_node(const Node& n, const std::size_t lvl) {
            if (!n.has_children())
                return write_string(n.data);

            if (!put('{'))
                return false;
            if (opt_.indent && !put('\n'))
                return false;

            // mixed content goes first, under the synthetic content key
            if (!n.data.empty()) {
                std::string key;
                key.reserve(opt_.content_prefix.size() + kContentKey.size());
                key.append(opt_.content_prefix);
                key.append(kContentKey);

                if (!indent(lvl + 1))
                    return false;
                if (!write_key(key))
                    return false;
                if (!write_string(n.data))
                    return false;
                if (!puts(separator()))
                    return false;
            }

            const auto entries = sorted_entries(n);

            for (std::size_t i = 0; i < entries.size(); ++i) {
                if (i && !puts(separator()))
                    return false;
                if (!indent(lvl + 1))
                    return false;

                const auto& [label, kids] = *entries[i];
                if (!write_key(label))
                    return false;

                if (kids.size() == 1) {
                    if (!write_node(kids.front(), lvl + 1))
                        return false;
                } else if (!write_array(kids, lvl + 2)) {
                    return false;
                }
            }

            if ((opt_.indent || opt_.newline_before_close) && !put('\n'))
                return false;
            if (!indent(lvl))
                return false;

            return put('}');
        }

        Sink sink_;
        Options opt_ {};
        EncodeError err_ {};
        std::size_t written_ {};
    };

    class Encoder {
    public:
        explicit Encoder(std::ostream& os, Options opt = {}): core_(StreamSink {&os}, std::move(opt)) { }

        Encoder& set_attribute_prefix(const std::string_view prefix) {
            core_.set_attribute_prefix(prefix);
            return *this;
        }

        Encoder& set_content_prefix(const std::string_view prefix) {
            core_.set_content_prefix(prefix);
            return *this;
        }

        Encoder& set_indent(const std::string_view text) {
            core_.set_indent(text);
            return *this;
        }

        Encoder& set_newline_before_close(const bool enabled) {
            core_.set_newline_before_close(enabled);
            return *this;
        }

        [[nodiscard]] XML2JSON_FORCEINLINE bool encode(const Node* root) {
            return core_.encode(root);
        }

        [[nodiscard]] XML2JSON_FORCEINLINE bool encode_with_custom_prefixes(const Node* root, const std::string_view content_prefix,
                                                                             const std::string_view attribute_prefix) {
            return core_.encode_with_custom_prefixes(root, content_prefix, attribute_prefix);
        }

        [[nodiscard]] XML2JSON_FORCEINLINE bool ok() const noexcept {
            return core_.ok();
        }

        [[nodiscard]] XML2JSON_FORCEINLINE const EncodeError& error() const noexcept {
            return core_.error();
        }

        [[nodiscard]] XML2JSON_FORCEINLINE const Options& options() const noexcept {
            return core_.options();
        }

    private:
        EncoderCore<StreamSink> core_;
    };

    [[nodiscard]] inline std::string sanitize(const std::string_view s) {
        StringSink sink;
        sink.out.reserve(s.size() + 2);
        if (!detail::write_sanitized(sink, s))
            return {};
        return sink.finish();
    }

    [[nodiscard]] inline std::string encode(const Node& root, const Options& opt, EncodeError* err) {
        EncoderCore core(StringSink {}, opt);
        const bool res = core.encode(&root);
        if (err)
            *err = core.error();
        if (!res)
            return {};
        return core.finish();
    }

    [[nodiscard]] inline std::string encode(const Node& root, const Options& opt = {}) {
        return encode(root, opt, nullptr);
    }

    inline EncodeError encode(const Node* root, std::ostream& os, const Options& opt = {}) {
        Encoder enc(os, opt);
        (void)enc.encode(root);
        return enc.error();
    }

} // namespace xml2json

#endif // XML2JSON_HPP
