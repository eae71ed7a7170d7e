#include "tool_handlers/tool_handlers.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

// Tool handler for "add".
// Integer operands add as integers; anything else adds as double. The sum is
// printed with the JSON number formatter, so 2 + 3 gives "5" and 2 + 3.5
// gives "5.5". A double sum that overflows prints as "inf" or "-inf".

// Missing or null operands count as 0. Throws on non-numeric operands.
static json read_operand(const json &arguments, const char *name) {
    if (!arguments.contains(name) || arguments[name].is_null()) {
        return 0;
    }
    const json &value = arguments[name];
    if (!value.is_number()) {
        throw std::invalid_argument(std::string("argument '") + name +
                                    "' must be a number, got " + value.type_name());
    }
    return value;
}

static bool fits_int64(const json &value) {
    if (!value.is_number_unsigned()) {
        return true;
    }
    return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
}

static json add_numbers(const json &left, const json &right) {
    if (left.is_number_integer() && right.is_number_integer() && fits_int64(left) && fits_int64(right)) {
        std::int64_t left_value = left.get<std::int64_t>();
        std::int64_t right_value = right.get<std::int64_t>();
        bool overflows = (right_value > 0 && left_value > std::numeric_limits<std::int64_t>::max() - right_value) ||
                         (right_value < 0 && left_value < std::numeric_limits<std::int64_t>::min() - right_value);
        if (!overflows) {
            return left_value + right_value;
        }
    }
    return left.get<double>() + right.get<double>();
}

// json::dump() writes non-finite numbers as "null".
static std::string format_sum(const json &sum) {
    if (sum.is_number_float()) {
        double value = sum.get<double>();
        if (std::isnan(value)) {
            return "nan";
        }
        if (std::isinf(value)) {
            return value < 0 ? "-inf" : "inf";
        }
    }
    return sum.dump();
}

static mcp_tools::ToolResult handle_add(const json &arguments) {
    json sum = add_numbers(read_operand(arguments, "a"), read_operand(arguments, "b"));
    return mcp_tools::text_result("Result: " + format_sum(sum));
}

namespace tool_add {

mcp_tools::ToolDefinition make_definition() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"a", {{"type", "number"}, {"description", "First number"}}},
        {"b", {{"type", "number"}, {"description", "Second number"}}}
    };
    input_schema["required"] = json::array({"a", "b"});

    return {
        "add",
        "Add two numbers together",
        input_schema,
        handle_add
    };
}

} // namespace tool_add
