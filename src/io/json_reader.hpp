/**
 * JsonReader — parses episode records, config files and policy replies
 * into a JsonValue tree.
 *
 * A document must hold exactly one value: a truncated or concatenated
 * episode line is an error, not half a record. Numbers that overflow a
 * double, raw control characters in strings and nesting deeper than 64
 * levels are errors too. Messages carry line and column.
 *
 * Usage:
 *   auto rec = JsonReader::parse(line);
 *   double t = rec["timestamp"].get_number(0.0);
 *   Vec3 p;
 *   if (rec["state"]["position"].get_vec3(p)) { ... }
 */

#ifndef PURSUIT_JSON_READER_HPP
#define PURSUIT_JSON_READER_HPP

#include "core/state_vector.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pursuit {

enum class JsonKind {
    Null,
    Bool,
    Number,
    String,
    Object,
    Array
};

/**
 * One node of a parsed document. Object members keep document order; a
 * repeated key overwrites the earlier value in place.
 *
 * Indexing never throws: a missing key, an out-of-range index or a node of
 * the wrong kind yields a shared null node, so lookups chain safely
 * (rec["state"]["position"][0]). The as_* accessors throw on a kind
 * mismatch; the get_* accessors fall back to a default.
 */
class JsonValue {
public:
    using Member = std::pair<std::string, JsonValue>;

    JsonValue() = default;
    explicit JsonValue(bool b) : kind_(JsonKind::Bool), boolean_(b) {}
    explicit JsonValue(double d) : kind_(JsonKind::Number), number_(d) {}
    explicit JsonValue(std::string s) : kind_(JsonKind::String), text_(std::move(s)) {}

    static JsonValue object() { JsonValue v; v.kind_ = JsonKind::Object; return v; }
    static JsonValue array()  { JsonValue v; v.kind_ = JsonKind::Array; return v; }

    JsonKind kind() const { return kind_; }
    bool is_null()   const { return kind_ == JsonKind::Null; }
    bool is_bool()   const { return kind_ == JsonKind::Bool; }
    bool is_number() const { return kind_ == JsonKind::Number; }
    bool is_string() const { return kind_ == JsonKind::String; }
    bool is_object() const { return kind_ == JsonKind::Object; }
    bool is_array()  const { return kind_ == JsonKind::Array; }

    // ── Strict ──

    double as_number() const {
        expect(JsonKind::Number, "a number");
        return number_;
    }

    const std::string& as_string() const {
        expect(JsonKind::String, "a string");
        return text_;
    }

    const std::vector<Member>& as_object() const {
        expect(JsonKind::Object, "an object");
        return members_;
    }

    // ── Lenient ──

    bool get_bool(bool fallback = false) const { return is_bool() ? boolean_ : fallback; }
    double get_number(double fallback = 0.0) const { return is_number() ? number_ : fallback; }
    int get_int(int fallback = 0) const { return is_number() ? static_cast<int>(number_) : fallback; }
    std::string get_string(const std::string& fallback = "") const {
        return is_string() ? text_ : fallback;
    }

    const JsonValue& operator[](const std::string& key) const {
        const JsonValue* v = find(key);
        return v ? *v : nil();
    }

    const JsonValue& operator[](size_t index) const {
        return (is_array() && index < elements_.size()) ? elements_[index] : nil();
    }

    bool has(const std::string& key) const { return find(key) != nullptr; }

    /// Element count of an array, member count of an object, else 0
    size_t size() const {
        if (is_array()) return elements_.size();
        if (is_object()) return members_.size();
        return 0;
    }

    /// Array of at least min_count numbers -> out; out untouched otherwise
    bool get_numbers(std::vector<double>& out, size_t min_count = 0) const {
        if (!is_array() || elements_.size() < min_count) return false;
        std::vector<double> vals;
        vals.reserve(elements_.size());
        for (const JsonValue& e : elements_) {
            if (!e.is_number()) return false;
            vals.push_back(e.number_);
        }
        out.swap(vals);
        return true;
    }

    /// [x, y, z] -> out (extra elements ignored)
    bool get_vec3(Vec3& out) const {
        std::vector<double> vals;
        if (!get_numbers(vals, 3)) return false;
        out = Vec3{vals[0], vals[1], vals[2]};
        return true;
    }

    /// {"x": .., "y": .., "z": ..} -> out; all three must be numbers
    bool get_xyz(Vec3& out) const {
        const JsonValue& x = (*this)["x"];
        const JsonValue& y = (*this)["y"];
        const JsonValue& z = (*this)["z"];
        if (!x.is_number() || !y.is_number() || !z.is_number()) return false;
        out = Vec3{x.number_, y.number_, z.number_};
        return true;
    }

    // ── Building ──

    void set(std::string key, JsonValue val) {
        for (Member& m : members_) {
            if (m.first == key) {
                m.second = std::move(val);
                return;
            }
        }
        members_.emplace_back(std::move(key), std::move(val));
    }

    void push(JsonValue val) { elements_.push_back(std::move(val)); }

private:
    JsonKind kind_ = JsonKind::Null;
    bool boolean_ = false;
    double number_ = 0.0;
    std::string text_;
    std::vector<Member> members_;
    std::vector<JsonValue> elements_;

    const JsonValue* find(const std::string& key) const {
        if (!is_object()) return nullptr;
        for (const Member& m : members_) {
            if (m.first == key) return &m.second;
        }
        return nullptr;
    }

    void expect(JsonKind k, const char* what) const {
        if (kind_ != k) throw std::runtime_error(std::string("JSON value is not ") + what);
    }

    static const JsonValue& nil() {
        static const JsonValue null_node;
        return null_node;
    }
};

class JsonReader {
public:
    /// @throws std::runtime_error with line and column on malformed input
    static JsonValue parse(const std::string& text);

    /// @throws std::runtime_error naming the file on open or parse failure
    static JsonValue parse_file(const std::string& path);
};

} // namespace pursuit

#endif // PURSUIT_JSON_READER_HPP
