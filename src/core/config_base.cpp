// src/core/config_base.cpp
#include "trade_pilot/core/config_base.hpp"
#include <fstream>
#include <iterator>

namespace trade_pilot {

namespace {
constexpr const char* kComponent = "ConfigBase";
}

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    std::string text;
    try {
        text = to_json().dump(4);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                std::string("Config cannot be serialized: ") + e.what(), kComponent);
    }

    std::ofstream out(filepath, std::ios::trunc);
    if (!out) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot write config file " + filepath,
                                kComponent);
    }
    out << text << '\n';
    out.flush();
    if (!out) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Short write on config file " + filepath,
                                kComponent);
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream in(filepath);
    if (!in) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config file not found: " + filepath,
                                kComponent);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto document = nlohmann::json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR, "Malformed JSON in " + filepath,
                                kComponent);
    }

    try {
        from_json(document);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Bad value in " + filepath + ": " + e.what(), kComponent);
    }
    return Result<void>();
}

}  // namespace trade_pilot
