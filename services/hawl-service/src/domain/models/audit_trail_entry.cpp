#include "audit_trail_entry.h"
#include "exceptions.h"

namespace nisab::hawl::domain {

namespace {

Json::Value optionalAmount(const std::optional<double>& v) {
    return v ? Json::Value(*v) : Json::Value(Json::nullValue);
}

std::optional<double> readOptionalAmount(const Json::Value& v) {
    if (v.isNull()) return std::nullopt;
    if (!v.isNumeric()) {
        throw common::ParsingException("amount is not numeric");
    }
    return v.asDouble();
}

Json::Value stateToJson(const FinancialState& state) {
    Json::Value json;
    json["status"] = toString(state.status);
    json["thresholdValue"] = state.thresholdValue;
    json["totalWealth"] = optionalAmount(state.totalWealth);
    json["zakatAmount"] = optionalAmount(state.zakatAmount);
    return json;
}

FinancialState stateFromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw common::ParsingException("financial state must be an object");
    }
    auto status = parseRecordStatus(json["status"].asString());
    if (!status) {
        throw common::ParsingException("unknown status in financial state");
    }
    FinancialState state;
    state.status = *status;
    state.thresholdValue = json["thresholdValue"].asDouble();
    state.totalWealth = readOptionalAmount(json["totalWealth"]);
    state.zakatAmount = readOptionalAmount(json["zakatAmount"]);
    return state;
}

utils::CivilDate requireDate(const Json::Value& v, const char* field) {
    auto date = utils::parseDate(v.asString());
    if (!date) {
        throw common::ParsingException(std::string("invalid date in '") + field + "'");
    }
    return *date;
}

struct ChangeJsonWriter {
    Json::Value operator()(const CreatedChange& c) const {
        Json::Value json;
        json["kind"] = "created";
        json["basis"] = toString(c.basis);
        json["thresholdValue"] = c.thresholdValue;
        json["currency"] = c.currency;
        json["hawlStartDate"] = c.hawlStartDate.toString();
        json["expectedCompletionDate"] = c.expectedCompletionDate.toString();
        return json;
    }

    Json::Value operator()(const FinalizationChange& c) const {
        Json::Value json;
        json["kind"] = "finalization";
        json["before"] = stateToJson(c.before);
        json["after"] = stateToJson(c.after);
        return json;
    }

    Json::Value operator()(const UnlockChange& c) const {
        Json::Value json;
        json["kind"] = "unlock";
        json["lockedState"] = stateToJson(c.lockedState);
        json["reasonEncrypted"] = c.reasonEncrypted;
        return json;
    }

    Json::Value operator()(const EditChange& c) const {
        Json::Value json;
        json["kind"] = "edit";
        Json::Value fields(Json::arrayValue);
        for (const auto& f : c.fields) {
            Json::Value item;
            item["field"] = f.field;
            item["before"] = f.before;
            item["after"] = f.after;
            fields.append(item);
        }
        json["fields"] = fields;
        return json;
    }
};

} // anonymous namespace

std::string toString(AuditEventType type) {
    switch (type) {
        case AuditEventType::Created: return "created";
        case AuditEventType::Finalized: return "finalized";
        case AuditEventType::Unlocked: return "unlocked";
        case AuditEventType::Edited: return "edited";
        case AuditEventType::Refinalized: return "refinalized";
    }
    return "created";
}

std::optional<AuditEventType> parseAuditEventType(const std::string& text) {
    if (text == "created") return AuditEventType::Created;
    if (text == "finalized") return AuditEventType::Finalized;
    if (text == "unlocked") return AuditEventType::Unlocked;
    if (text == "edited") return AuditEventType::Edited;
    if (text == "refinalized") return AuditEventType::Refinalized;
    return std::nullopt;
}

FinancialState FinancialState::of(const NisabYearRecord& record) {
    FinancialState state;
    state.status = record.status;
    state.thresholdValue = record.thresholdValue;
    state.totalWealth = record.totalWealth;
    state.zakatAmount = record.zakatAmount;
    return state;
}

bool changeMatchesEvent(AuditEventType type, const AuditChange& change) {
    switch (type) {
        case AuditEventType::Created:
            return std::holds_alternative<CreatedChange>(change);
        case AuditEventType::Finalized:
        case AuditEventType::Refinalized:
            return std::holds_alternative<FinalizationChange>(change);
        case AuditEventType::Unlocked:
            return std::holds_alternative<UnlockChange>(change);
        case AuditEventType::Edited:
            return std::holds_alternative<EditChange>(change);
    }
    return false;
}

Json::Value changeToJson(const AuditChange& change) {
    return std::visit(ChangeJsonWriter{}, change);
}

AuditChange changeFromJson(AuditEventType type, const Json::Value& json) {
    if (!json.isObject()) {
        throw common::ParsingException("audit change summary must be an object");
    }

    switch (type) {
        case AuditEventType::Created: {
            auto basis = parseNisabBasis(json["basis"].asString());
            if (!basis) {
                throw common::ParsingException("invalid basis in created change");
            }
            CreatedChange c;
            c.basis = *basis;
            c.thresholdValue = json["thresholdValue"].asDouble();
            c.currency = json["currency"].asString();
            c.hawlStartDate = requireDate(json["hawlStartDate"], "hawlStartDate");
            c.expectedCompletionDate = requireDate(json["expectedCompletionDate"], "expectedCompletionDate");
            return c;
        }
        case AuditEventType::Finalized:
        case AuditEventType::Refinalized: {
            FinalizationChange c;
            c.before = stateFromJson(json["before"]);
            c.after = stateFromJson(json["after"]);
            return c;
        }
        case AuditEventType::Unlocked: {
            UnlockChange c;
            c.lockedState = stateFromJson(json["lockedState"]);
            c.reasonEncrypted = json["reasonEncrypted"].asString();
            return c;
        }
        case AuditEventType::Edited: {
            if (!json["fields"].isArray()) {
                throw common::ParsingException("edited change without fields");
            }
            EditChange c;
            for (const auto& item : json["fields"]) {
                c.fields.push_back(FieldChange{
                    item["field"].asString(), item["before"].asString(), item["after"].asString()});
            }
            return c;
        }
    }
    throw common::ParsingException("unknown audit event type");
}

Json::Value AuditTrailEntry::toJson() const {
    Json::Value json;
    json["id"] = id;
    json["recordId"] = recordId;
    json["userId"] = userId;
    json["sequence"] = sequence;
    json["eventType"] = toString(eventType);
    json["timestamp"] = utils::formatIso8601(timestamp, true);
    json["changes"] = changeToJson(change);
    json["ipAddress"] = ipAddress ? Json::Value(*ipAddress) : Json::Value(Json::nullValue);
    json["userAgent"] = userAgent ? Json::Value(*userAgent) : Json::Value(Json::nullValue);
    return json;
}

} // namespace nisab::hawl::domain
