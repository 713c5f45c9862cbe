#include "Arguments.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace mcp::args {

namespace {

const json* find(const json& args, const std::string& key) {
    if (!args.is_object()) return nullptr;
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) return nullptr;
    return &*it;
}

McpError missing(const std::string& key) {
    return McpError(rpc_error::INVALID_PARAMS, "Missing required argument '" + key + "'");
}

McpError wrongType(const std::string& key, const char* expected) {
    return McpError(rpc_error::INVALID_PARAMS,
                    "Argument '" + key + "' must be " + expected);
}

}  // namespace

std::optional<std::string> optionalString(const json& args, const std::string& key) {
    const json* v = find(args, key);
    if (!v) return std::nullopt;
    if (!v->is_string()) throw wrongType(key, "a string");
    return v->get<std::string>();
}

std::string requireString(const json& args, const std::string& key) {
    auto v = optionalString(args, key);
    if (!v) throw missing(key);
    return *v;
}

std::optional<double> optionalNumber(const json& args, const std::string& key) {
    const json* v = find(args, key);
    if (!v) return std::nullopt;
    if (!v->is_number()) throw wrongType(key, "a number");
    return v->get<double>();
}

double requireNumber(const json& args, const std::string& key) {
    auto v = optionalNumber(args, key);
    if (!v) throw missing(key);
    return *v;
}

std::int64_t requireInteger(const json& args, const std::string& key) {
    const json* v = find(args, key);
    if (!v) throw missing(key);
    if (v->is_number_unsigned()) {
        const std::uint64_t u = v->get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return static_cast<std::int64_t>(u);
        }
        throw wrongType(key, "an integer");
    }
    if (v->is_number_integer()) return v->get<std::int64_t>();
    if (v->is_number_float()) {
        double d = v->get<double>();
        if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.0e15) {
            return static_cast<std::int64_t>(d);
        }
    }
    throw wrongType(key, "an integer");
}

std::optional<std::string> optionalText(const json& args, const std::string& key) {
    const json* v = find(args, key);
    if (!v) return std::nullopt;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number()) return v->dump();
    throw wrongType(key, "a string");
}

} // namespace mcp::args
