#pragma once

#include "engine_config.hpp"
#include <string>
#include <cstdlib>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_audit;
    
    // Postgres
    std::string pg_dsn;
    bool persist_audit;
    
    // Engine parameters
    EngineConfig engine;
    
    // HTTP
    std::string listen_addr;
    int listen_port;
    
    // Service
    std::string service_name;
    std::string log_level;
    
    static Config from_env();
    void validate() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
