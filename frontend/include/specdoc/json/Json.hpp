// frontend/include/specdoc/json/Json.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace specdoc::json {

    struct Value {
        enum class Kind : uint8_t {
            kNull,
            kBool,
            kNumber,
            kString,
            kArray,
            kObject,
        };

        Kind kind = Kind::kNull;
        bool bool_v = false;
        double number_v = 0.0;
        std::string string_v{};
        std::vector<Value> array_v{};
        std::map<std::string, Value> object_v{};
    };

    /// @brief JSON(C) 파서. `//`, `/* */` 주석과 trailing comma 를 허용한다.
    class Parser {
    public:
        explicit Parser(std::string_view src) : src_(src) {}

        bool parse(Value& out);

        /// @brief 실패 지점 byte offset
        uint32_t error_offset() const { return static_cast<uint32_t>(pos_); }

    private:
        bool parse_value_(Value& out);
        bool parse_literal_(Value& out);
        bool parse_number_(Value& out);
        bool parse_string_(std::string& out);
        bool parse_array_(Value& out);
        bool parse_object_(Value& out);
        bool consume_literal_(std::string_view lit);
        void skip_ws_();
        bool fail_();

        std::string_view src_{};
        size_t pos_ = 0;
        bool ok_ = true;
    };

    const Value* get(const Value& obj, std::string_view key);
    std::optional<std::string_view> as_string(const Value* v);
    std::optional<int64_t> as_i64(const Value* v);
    std::optional<bool> as_bool(const Value* v);

    std::string escape(std::string_view s);

    /// @brief compact 직렬화 (object key 는 사전순)
    std::string to_text(const Value& v);

} // namespace specdoc::json
