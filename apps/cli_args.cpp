// SPDX-License-Identifier: Apache-2.0
// Part of dmart-cpp project.
// apps/cli_args.cpp

#include "cli_args.hpp"

#include <algorithm>
#include <stdexcept>

bool parse_cli_args(int argc, char** argv, CliArgs& out){
    out.pool.connect_timeout_sec = 5;
    out.pool.io_timeout_sec      = 30;

    try {
        for(int i=1;i<argc;++i){
            std::string a=argv[i];
            if(a=="--url" && i+1<argc) out.cfg.url = argv[++i];
            else if(a=="--user" && i+1<argc) out.cfg.username = argv[++i];
            else if(a=="--password" && i+1<argc) out.cfg.password = argv[++i];
            else if(a=="--tls_ca" && i+1<argc) out.pool.tls_ca_file = argv[++i];
            else if(a=="--insecure" && i+1<argc) out.pool.tls_verify_peer = (std::stoi(argv[++i])==0);
            else if(a=="--log" && i+1<argc) out.cfg.log_file = argv[++i];
            else if(a=="--quiet" && i+1<argc) out.cfg.log_stdout = (std::stoi(argv[++i])==0);
            else if(a=="--connect_timeout" && i+1<argc) out.pool.connect_timeout_sec = std::max(1, std::stoi(argv[++i]));
            else if(a=="--io_timeout" && i+1<argc)      out.pool.io_timeout_sec      = std::max(1, std::stoi(argv[++i]));
            else if(a=="--attachments") out.attachments = true;
            else if(a.compare(0, 2, "--")==0) return false;
            else out.args.push_back(a);
        }
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }

    return !(out.cfg.url.empty() || out.cfg.username.empty() || out.cfg.password.empty() ||
             out.args.empty());
}
