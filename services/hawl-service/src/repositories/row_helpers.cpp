#include "row_helpers.h"
#include "exceptions.h"
#include "query_helpers.h"
#include <cmath>
#include <cstdlib>
#include <memory>

namespace nisab::hawl::repositories::rows {

std::chrono::system_clock::time_point requireTimestamp(const Json::Value& row, const std::string& field) {
    auto tp = optionalTimestamp(row, field);
    if (!tp) {
        throw common::ParsingException("Missing timestamp column '" + field + "'");
    }
    return *tp;
}

std::optional<std::chrono::system_clock::time_point> optionalTimestamp(const Json::Value& row,
                                                                       const std::string& field) {
    if (row[field].isNull()) return std::nullopt;
    auto tp = utils::parseIso8601(row[field].asString());
    if (!tp) {
        throw common::ParsingException("Invalid timestamp in '" + field + "': " + row[field].asString());
    }
    return tp;
}

utils::CivilDate requireDate(const Json::Value& row, const std::string& field) {
    auto date = utils::parseDate(common::db::getString(row, field));
    if (!date) {
        throw common::ParsingException("Invalid date in '" + field + "'");
    }
    return *date;
}

utils::hijri::HijriDate requireHijriDate(const Json::Value& row, const std::string& field) {
    auto date = utils::hijri::parse(common::db::getString(row, field));
    if (!date) {
        throw common::ParsingException("Invalid Hijri date in '" + field + "'");
    }
    return *date;
}

std::string timestampParam(const std::chrono::system_clock::time_point& tp) {
    return utils::formatIso8601(tp, true);
}

std::string optionalTimestampParam(const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp ? timestampParam(*tp) : "";
}

std::string compactJson(const Json::Value& json) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, json);
}

Json::Value parseJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw common::ParsingException("Invalid stored JSON: " + errors);
    }
    return root;
}

std::string encryptAmount(const common::IFieldCipher& cipher, const std::optional<double>& amount) {
    return amount ? cipher.encrypt(common::db::formatAmount(*amount)) : "";
}

std::optional<double> decryptAmount(const common::IFieldCipher& cipher, const Json::Value& row,
                                    const std::string& field) {
    std::string stored = common::db::getString(row, field);
    if (stored.empty()) return std::nullopt;

    std::string text = cipher.decrypt(stored);
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || !std::isfinite(value)) {
        throw common::ParsingException("Decrypted '" + field + "' is not a number");
    }
    return value;
}

} // namespace nisab::hawl::repositories::rows
