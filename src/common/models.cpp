/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/models.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace {

using nlohmann::json;

// 8-4-4-4-12 hex digits.
bool is_canonical_uuid(const std::string& s) {
    if (s.size() != 36) return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!std::isxdigit((unsigned char)s[i])) {
            return false;
        }
    }
    return true;
}

std::string strip_slashes(const std::string& s) {
    if (s == "/") return s;
    std::size_t a = 0;
    std::size_t b = s.size();
    while (a < b && s[a] == '/') ++a;
    while (b > a && s[b - 1] == '/') --b;
    return s.substr(a, b - a);
}

json attachments_to_json(const dmart::Attachments& a) {
    json out = json::object();
    for (const auto& kv : a) {
        out[dmart::to_string(kv.first)] = kv.second;
    }
    return out;
}

dmart::Attachments attachments_from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("attachments must be an object");
    dmart::Attachments a;
    for (auto it = j.begin(); it != j.end(); ++it) {
        a[dmart::resource_type_from_string(it.key())] = it.value().get<std::vector<json>>();
    }
    return a;
}

} // namespace

namespace dmart {

Record::Record(ResourceType resource_type,
               const std::string& shortname,
               const std::string& subpath,
               nlohmann::json attributes,
               const IdentifierAlphabet& alphabet)
    : _resource_type(resource_type),
      _attributes(std::move(attributes))
{
    if (!is_valid_shortname(shortname, alphabet)) {
        throw std::invalid_argument("invalid shortname: '" + shortname + "'");
    }
    if (!is_valid_subpath(subpath, alphabet)) {
        throw std::invalid_argument("invalid subpath: '" + subpath + "'");
    }
    if (!_attributes.is_object()) {
        throw std::invalid_argument("record attributes must be a JSON object");
    }
    _shortname = shortname;
    _subpath = strip_slashes(subpath);
}

void Record::set_uuid(const std::string& uuid) {
    if (!is_canonical_uuid(uuid)) {
        throw std::invalid_argument("invalid uuid: '" + uuid + "'");
    }
    _uuid = uuid;
}

void to_json(nlohmann::json& j, const Record& r) {
    j = json{
        {"resource_type", to_string(r.resource_type())},
        {"shortname", r.shortname()},
        {"subpath", r.subpath()},
        {"attributes", r.attributes()},
    };
    if (r.uuid()) j["uuid"] = *r.uuid();
    if (r.attachments()) j["attachments"] = attachments_to_json(*r.attachments());
    if (r.retrieve_lock_status) j["retrieve_lock_status"] = true;
}

Response Response::parse(const nlohmann::json& j) {
    if (!j.is_object()) throw std::invalid_argument("envelope must be a JSON object");

    Response r;
    r.status = status_from_string(j.at("status").get<std::string>());

    auto it = j.find("error");
    if (it != j.end() && !it->is_null()) {
        r.error = it->get<Error>();
    }
    if (r.status == Status::Failed && !r.error) {
        throw std::invalid_argument("failed envelope without an error");
    }

    it = j.find("records");
    if (it != j.end() && !it->is_null()) {
        if (!it->is_array()) throw std::invalid_argument("records must be an array");
        r.records.reserve(it->size());
        for (const auto& rec : *it) {
            try {
                r.records.push_back(rec.get<Record>());
            } catch (const std::invalid_argument&) {
                r.raw_records.push_back(rec);
            } catch (const nlohmann::json::exception&) {
                r.raw_records.push_back(rec);
            }
        }
    }

    it = j.find("attributes");
    if (it != j.end() && !it->is_null()) {
        r.attributes = *it;
    }
    return r;
}

void to_json(nlohmann::json& j, const Response& r) {
    j = json{{"status", to_string(r.status)}, {"records", r.records}};
    for (const auto& raw : r.raw_records) j["records"].push_back(raw);
    if (r.error) j["error"] = *r.error;
    if (r.attributes) j["attributes"] = *r.attributes;
}

void to_json(nlohmann::json& j, const ActionRequest& r) {
    j = json{
        {"space_name", r.space_name},
        {"request_type", to_string(r.request_type)},
        {"records", r.records},
    };
}

void to_json(nlohmann::json& j, const AggregationReducer& r) {
    j = json{{"name", r.name}, {"alias", r.alias}, {"args", r.args}};
}

void to_json(nlohmann::json& j, const AggregationType& a) {
    j = json{{"load", a.load}, {"group_by", a.group_by}};
    if (const auto* objs = std::get_if<std::vector<AggregationReducer>>(&a.reducers)) {
        j["reducers"] = *objs;
    } else {
        j["reducers"] = std::get<std::vector<std::string>>(a.reducers);
    }
}

void to_json(nlohmann::json& j, const QueryRequest& q) {
    json types = json::array();
    for (auto t : q.filter_types) types.push_back(to_string(t));

    j = json{
        {"type", to_string(q.type)},
        {"space_name", q.space_name},
        {"subpath", q.subpath},
        {"filter_types", types},
        {"filter_schema_names", q.filter_schema_names},
        {"filter_shortnames", q.filter_shortnames},
        {"search", q.search},
        {"sort_type", to_string(q.sort_type)},
        {"retrieve_json_payload", q.retrieve_json_payload},
        {"retrieve_attachments", q.retrieve_attachments},
        {"validate_schema", q.validate_schema},
        {"exact_subpath", q.exact_subpath},
        {"limit", q.limit},
        {"offset", q.offset},
    };
    if (q.from_date) j["from_date"] = *q.from_date;
    if (q.to_date) j["to_date"] = *q.to_date;
    if (q.sort_by) j["sort_by"] = *q.sort_by;
    if (q.jq_filter) j["jq_filter"] = *q.jq_filter;
    if (q.aggregation_data) j["aggregation_data"] = *q.aggregation_data;
}

} // namespace dmart

namespace nlohmann {

dmart::Record adl_serializer<dmart::Record>::from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("record must be a JSON object");

    json attrs = json::object();
    auto it = j.find("attributes");
    if (it != j.end() && !it->is_null()) attrs = *it;

    dmart::Record r(dmart::resource_type_from_string(j.at("resource_type").get<std::string>()),
                    j.at("shortname").get<std::string>(),
                    j.at("subpath").get<std::string>(),
                    std::move(attrs));

    it = j.find("uuid");
    if (it != j.end() && !it->is_null()) r.set_uuid(it->get<std::string>());

    it = j.find("attachments");
    if (it != j.end() && !it->is_null()) r.set_attachments(attachments_from_json(*it));

    it = j.find("retrieve_lock_status");
    if (it != j.end() && it->is_boolean()) r.retrieve_lock_status = it->get<bool>();
    return r;
}

} // namespace nlohmann
