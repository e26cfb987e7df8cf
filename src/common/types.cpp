/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/types.hpp"

#include <cstddef>
#include <stdexcept>
#include <utility>

namespace {

template <typename E, std::size_t N>
const char* name_of(const std::pair<E, const char*> (&table)[N], E v) {
    for (const auto& kv : table) {
        if (kv.first == v) return kv.second;
    }
    return "";
}

template <typename E, std::size_t N>
E value_of(const std::pair<E, const char*> (&table)[N], const std::string& s, const char* what) {
    for (const auto& kv : table) {
        if (s == kv.second) return kv.first;
    }
    throw std::invalid_argument(std::string("unknown ") + what + ": '" + s + "'");
}

using dmart::Status;
using dmart::RequestType;
using dmart::ResourceType;
using dmart::RequestMethod;
using dmart::QueryType;
using dmart::SortType;

const std::pair<Status, const char*> k_status[] = {
    {Status::Success, "success"},
    {Status::Failed,  "failed"},
};

const std::pair<RequestType, const char*> k_request_type[] = {
    {RequestType::Create,    "create"},
    {RequestType::Update,    "update"},
    {RequestType::Patch,     "patch"},
    {RequestType::UpdateAcl, "update_acl"},
    {RequestType::Assign,    "assign"},
    {RequestType::Replace,   "replace"},
    {RequestType::Delete,    "delete"},
    {RequestType::Move,      "move"},
};

const std::pair<ResourceType, const char*> k_resource_type[] = {
    {ResourceType::User,          "user"},
    {ResourceType::Group,         "group"},
    {ResourceType::Folder,        "folder"},
    {ResourceType::Schema,        "schema"},
    {ResourceType::Content,       "content"},
    {ResourceType::Acl,           "acl"},
    {ResourceType::Comment,       "comment"},
    {ResourceType::Media,         "media"},
    {ResourceType::DataAsset,     "data_asset"},
    {ResourceType::Locator,       "locator"},
    {ResourceType::Relationship,  "relationship"},
    {ResourceType::Alteration,    "alteration"},
    {ResourceType::History,       "history"},
    {ResourceType::Space,         "space"},
    {ResourceType::Branch,        "branch"},
    {ResourceType::Permission,    "permission"},
    {ResourceType::Role,          "role"},
    {ResourceType::Ticket,        "ticket"},
    {ResourceType::Json,          "json"},
    {ResourceType::Lock,          "lock"},
    {ResourceType::Post,          "post"},
    {ResourceType::Reaction,      "reaction"},
    {ResourceType::Reply,         "reply"},
    {ResourceType::Share,         "share"},
    {ResourceType::PluginWrapper, "plugin_wrapper"},
    {ResourceType::Notification,  "notification"},
    {ResourceType::Csv,           "csv"},
    {ResourceType::Jsonl,         "jsonl"},
    {ResourceType::Sqlite,        "sqlite"},
    {ResourceType::Duckdb,        "duckdb"},
    {ResourceType::Parquet,       "parquet"},
};

const std::pair<RequestMethod, const char*> k_method[] = {
    {RequestMethod::Get,    "GET"},
    {RequestMethod::Post,   "POST"},
    {RequestMethod::Delete, "DELETE"},
    {RequestMethod::Put,    "PUT"},
    {RequestMethod::Patch,  "PATCH"},
};

const std::pair<QueryType, const char*> k_query_type[] = {
    {QueryType::Search,                 "search"},
    {QueryType::Subpath,                "subpath"},
    {QueryType::Events,                 "events"},
    {QueryType::History,                "history"},
    {QueryType::Tags,                   "tags"},
    {QueryType::Spaces,                 "spaces"},
    {QueryType::Counters,               "counters"},
    {QueryType::Reports,                "reports"},
    {QueryType::Aggregation,            "aggregation"},
    {QueryType::Attachments,            "attachments"},
    {QueryType::AttachmentsAggregation, "attachments_aggregation"},
};

const std::pair<SortType, const char*> k_sort_type[] = {
    {SortType::Ascending,  "ascending"},
    {SortType::Descending, "descending"},
};

} // namespace

namespace dmart {

const char* to_string(Status v)        { return name_of(k_status, v); }
const char* to_string(RequestType v)   { return name_of(k_request_type, v); }
const char* to_string(ResourceType v)  { return name_of(k_resource_type, v); }
const char* to_string(RequestMethod v) { return name_of(k_method, v); }
const char* to_string(QueryType v)     { return name_of(k_query_type, v); }
const char* to_string(SortType v)      { return name_of(k_sort_type, v); }

Status status_from_string(const std::string& s) {
    return value_of(k_status, s, "status");
}

RequestType request_type_from_string(const std::string& s) {
    return value_of(k_request_type, s, "request type");
}

ResourceType resource_type_from_string(const std::string& s) {
    return value_of(k_resource_type, s, "resource type");
}

QueryType query_type_from_string(const std::string& s) {
    return value_of(k_query_type, s, "query type");
}

SortType sort_type_from_string(const std::string& s) {
    return value_of(k_sort_type, s, "sort type");
}

} // namespace dmart
