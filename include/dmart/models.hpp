/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "dmart/error.hpp"
#include "dmart/identifier.hpp"
#include "dmart/types.hpp"

namespace dmart {

using Attachments = std::map<ResourceType, std::vector<nlohmann::json>>;

// One entity submitted to or returned by the backend.
// Shortname and subpath are validated and the subpath is normalized
// ("/a/b/" -> "a/b", "/" stays "/") once, in the constructor.
// Throws std::invalid_argument on a pattern violation.
class Record {
public:
    Record(ResourceType resource_type,
           const std::string& shortname,
           const std::string& subpath,
           nlohmann::json attributes = nlohmann::json::object(),
           const IdentifierAlphabet& alphabet = default_alphabet());

    ResourceType resource_type() const { return _resource_type; }
    const std::string& shortname() const { return _shortname; }
    const std::string& subpath() const { return _subpath; }

    const std::optional<std::string>& uuid() const { return _uuid; }
    void set_uuid(const std::string& uuid);  // canonical 8-4-4-4-12 hex

    const nlohmann::json& attributes() const { return _attributes; }
    nlohmann::json&       attributes() { return _attributes; }

    const std::optional<Attachments>& attachments() const { return _attachments; }
    void set_attachments(Attachments a) { _attachments = std::move(a); }

    bool retrieve_lock_status = false;

private:
    ResourceType _resource_type;
    std::optional<std::string> _uuid;
    std::string _shortname;
    std::string _subpath;
    nlohmann::json _attributes;
    std::optional<Attachments> _attachments;
};

// Response envelope. status == Failed implies error is set;
// records is empty (never missing) when the body has none.
// Entries that do not form a valid Record (history rows, shortnames outside
// the identifier pattern, ...) are kept untouched in raw_records, in order.
struct Response {
    Status status = Status::Success;
    std::optional<Error> error;
    std::vector<Record> records;
    std::vector<nlohmann::json> raw_records;
    std::optional<nlohmann::json> attributes;

    // Throws std::invalid_argument / nlohmann::json::exception on a malformed envelope.
    static Response parse(const nlohmann::json& j);
};

void to_json(nlohmann::json& j, const Response& r);

// Body of POST /managed/request.
struct ActionRequest {
    std::string space_name;
    RequestType request_type = RequestType::Create;
    std::vector<Record> records;
};

void to_json(nlohmann::json& j, const ActionRequest& r);

struct AggregationReducer {
    std::string name;
    std::string alias;
    std::vector<std::string> args;
};

struct AggregationType {
    std::vector<std::string> load;
    std::vector<std::string> group_by;
    std::variant<std::vector<AggregationReducer>, std::vector<std::string>> reducers;
};

void to_json(nlohmann::json& j, const AggregationReducer& r);
void to_json(nlohmann::json& j, const AggregationType& a);

// Body of POST /managed/query. Unset optionals are omitted on the wire.
struct QueryRequest {
    QueryType type = QueryType::Search;
    std::string space_name;
    std::string subpath;
    std::vector<ResourceType> filter_types;
    std::vector<std::string> filter_schema_names;
    std::vector<std::string> filter_shortnames;
    std::string search;
    std::optional<std::string> from_date;
    std::optional<std::string> to_date;
    std::optional<std::string> sort_by;
    SortType sort_type = SortType::Ascending;
    bool retrieve_json_payload = false;
    bool retrieve_attachments = false;
    bool validate_schema = true;
    std::optional<std::string> jq_filter;
    bool exact_subpath = false;
    int limit = 10;
    int offset = 0;
    std::optional<AggregationType> aggregation_data;
};

void to_json(nlohmann::json& j, const QueryRequest& q);

struct Translation {
    std::string ar;
    std::string en;
    std::string kd;
};

struct Permission {
    std::vector<std::string> allowed_actions;
    std::vector<std::string> conditions;
    std::vector<nlohmann::json> restricted_fields;
    nlohmann::json allowed_fields_values = nlohmann::json::object();
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Translation, ar, en, kd)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Permission, allowed_actions, conditions,
                                   restricted_fields, allowed_fields_values)

void to_json(nlohmann::json& j, const Record& r);

} // namespace dmart

namespace nlohmann {

// Record has no default state; decode through its validating constructor.
template <>
struct adl_serializer<dmart::Record> {
    static dmart::Record from_json(const json& j);
    static void to_json(json& j, const dmart::Record& r) { dmart::to_json(j, r); }
};

} // namespace nlohmann
