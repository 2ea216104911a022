/**
 * JsonWriter — streaming JSON output (header-only)
 *
 * Two layouts: Pretty (indented, for trajectory files) and Line (one
 * compact line, for episode records and policy frames). Non-finite doubles
 * are written as null. Vec3 is written [x, y, z]; quaternions [w, x, y, z].
 *
 * Usage:
 *   JsonWriter w(out, JsonLayout::Line);
 *   w.begin_object();
 *     w.kv("type", "state");
 *     w.kv("t", 0.01);
 *     w.key("position").value(Vec3{1, 2, 3});
 *   w.end_object();
 */

#ifndef PURSUIT_JSON_WRITER_HPP
#define PURSUIT_JSON_WRITER_HPP

#include "core/state_vector.hpp"
#include <array>
#include <cmath>
#include <cstdio>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace pursuit {

enum class JsonLayout {
    Pretty,
    Line
};

class JsonWriter {
public:
    explicit JsonWriter(std::ostream& os, JsonLayout layout = JsonLayout::Pretty, int indent = 2)
        : os_(os), layout_(layout), indent_(indent) {}

    // ── Containers ──

    JsonWriter& begin_object() { return open('{'); }
    JsonWriter& end_object()   { return close('}'); }
    JsonWriter& begin_array()  { return open('['); }
    JsonWriter& end_array()    { return close(']'); }

    JsonWriter& key(const std::string& k) {
        element();
        write_string(k);
        os_ << (layout_ == JsonLayout::Line ? ":" : ": ");
        after_key_ = true;
        return *this;
    }

    // ── Scalars ──

    JsonWriter& value(const std::string& v) { element(); write_string(v); return *this; }
    JsonWriter& value(const char* v)        { return value(std::string(v)); }
    JsonWriter& value(bool v)               { element(); os_ << (v ? "true" : "false"); return *this; }
    JsonWriter& value(int v)                { element(); os_ << v; return *this; }
    JsonWriter& value(long long v)          { element(); os_ << v; return *this; }
    JsonWriter& value(size_t v)             { element(); os_ << v; return *this; }

    JsonWriter& value(double v) {
        element();
        write_number(v);
        return *this;
    }

    /// Absent values are written as null
    JsonWriter& value(const std::optional<double>& v) {
        if (!v) return null_value();
        return value(*v);
    }

    JsonWriter& null_value() {
        element();
        os_ << "null";
        return *this;
    }

    // ── Geometry ──

    JsonWriter& value(const Vec3& v) {
        begin_array();
        value(v.x).value(v.y).value(v.z);
        return end_array();
    }

    JsonWriter& value(const Quat& q) {
        begin_array();
        value(q.w).value(q.x).value(q.y).value(q.z);
        return end_array();
    }

    JsonWriter& value(const std::array<double, 4>& wxyz) {
        begin_array();
        for (double c : wxyz) value(c);
        return end_array();
    }

    template<typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        return value(v);
    }

private:
    struct Level {
        char close;
        bool empty = true;
    };

    std::ostream& os_;
    JsonLayout layout_;
    int indent_;
    std::vector<Level> levels_;
    bool after_key_ = false;

    JsonWriter& open(char bracket) {
        element();
        os_ << bracket;
        levels_.push_back(Level{bracket == '{' ? '}' : ']'});
        return *this;
    }

    JsonWriter& close(char bracket) {
        bool was_empty = levels_.empty() || levels_.back().empty;
        if (!levels_.empty()) levels_.pop_back();
        if (!was_empty) break_line();
        os_ << bracket;
        return *this;
    }

    // Comma and line break before a new member or element; nothing after a key
    void element() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (levels_.empty()) return;
        Level& level = levels_.back();
        if (!level.empty) os_ << ',';
        level.empty = false;
        break_line();
    }

    void break_line() {
        if (layout_ == JsonLayout::Line) return;
        os_ << '\n' << std::string(levels_.size() * static_cast<size_t>(indent_), ' ');
    }

    void write_number(double v) {
        if (!std::isfinite(v)) {
            os_ << "null";
            return;
        }
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.15g", v);
        os_ << buf;
    }

    void write_string(const std::string& s) {
        os_ << '"';
        for (char c : s) {
            switch (c) {
                case '"':  os_ << "\\\""; break;
                case '\\': os_ << "\\\\"; break;
                case '\n': os_ << "\\n";  break;
                case '\r': os_ << "\\r";  break;
                case '\t': os_ << "\\t";  break;
                case '\b': os_ << "\\b";  break;
                case '\f': os_ << "\\f";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        os_ << buf;
                    } else {
                        os_ << c;
                    }
            }
        }
        os_ << '"';
    }
};

} // namespace pursuit

#endif // PURSUIT_JSON_WRITER_HPP
