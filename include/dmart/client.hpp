/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dmart/client_config.hpp"
#include "dmart/error.hpp"
#include "dmart/models.hpp"
#include "dmart/transport.hpp"
#include "dmart/types.hpp"

namespace dmart {

// Typed dmart client. Every operation is one request through the shared
// transport; failures raise DmartException (record shape violations raise
// std::invalid_argument). Safe to use from several threads.
class Client {
public:
    // transport defaults to the process-wide SessionPool::acquire().
    explicit Client(const ClientConfig& cfg, std::shared_ptr<HttpTransport> transport = nullptr);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // POST /user/login with the configured credentials; stores the token.
    // Any failure raises ErrorKind::Connection and leaves no token behind.
    void connect();
    // Replaces url and credentials, then connect().
    void connect(const std::string& url, const std::string& username, const std::string& password);

    // POST /user/logout. Raises Unauthenticated without a token. The token is
    // dropped once the backend answered (even with a rejection); on a
    // transport failure it is kept.
    void disconnect();

    bool is_connected() const;

    Response get_profile();

    // POST /managed/request
    Response create(const std::string& space_name,
                    const std::string& subpath,
                    const nlohmann::json& attributes,
                    const std::string& shortname = "auto",
                    ResourceType resource_type = ResourceType::Content);
    Response update(const std::string& space_name,
                    const std::string& subpath,
                    const std::string& shortname,
                    const nlohmann::json& attributes,
                    ResourceType resource_type = ResourceType::Content);
    Response delete_entry(const std::string& space_name,
                          const std::string& subpath,
                          const std::string& shortname,
                          ResourceType resource_type = ResourceType::Content);
    Response request(const ActionRequest& action);

    // GET /managed/entry/{type}/{space}/{subpath}/{shortname}
    Response read(const std::string& space_name,
                  const std::string& subpath,
                  const std::string& shortname,
                  bool retrieve_attachments = false,
                  ResourceType resource_type = ResourceType::Content);

    // GET /managed/payload/content/{space}/{subpath}/{shortname}.json
    // The payload is returned as stored, not wrapped in an envelope.
    nlohmann::json read_json_payload(const std::string& space_name,
                                     const std::string& subpath,
                                     const std::string& shortname);

    // POST /managed/query, type "search"; keys of extra are merged last.
    Response query(const std::string& space_name,
                   const std::string& subpath,
                   const std::string& search = "",
                   const std::vector<std::string>& filter_schema_names = {},
                   const nlohmann::json& extra = nlohmann::json::object());
    Response query(const QueryRequest& q);

    // POST /managed/data-asset
    Response query_data_asset(const std::string& space_name,
                              const std::string& subpath,
                              const std::string& shortname,
                              const std::string& data_asset_type,
                              const std::string& query_string,
                              const std::optional<std::string>& schema_shortname = std::nullopt,
                              ResourceType resource_type = ResourceType::Content);

    // PUT /managed/progress-ticket/{space}/{subpath}/{shortname}/{action}
    Response progress_ticket(const std::string& space_name,
                             const std::string& subpath,
                             const std::string& shortname,
                             const std::string& action,
                             const std::optional<std::string>& cancellation_reasons = std::nullopt);

    // POST /managed/resource_with_payload (multipart)
    Response upload_resource_with_payload(const std::string& space_name,
                                          const Record& record,
                                          std::string payload,
                                          const std::string& payload_file_name,
                                          const std::string& payload_mime_type);

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace dmart
