#pragma once

#include <iostream>
#include <string>
#include <mxpool/detail/result.hpp>
#include <mxpool/pool/pool_config.hpp>

inline void print_error(const mxpool::error_info& err)
{
    std::cout << "Error: " << mxpool::to_string(err.code) << " - " << err.message << "\n";
    if (!err.detail.empty())
        std::cout << "Detail: " << err.detail;
    if (err.sys)
        std::cout << "Sys: " << err.sys.message() << "\n";
    std::cout << "Where: " << err.where.file_name() << ":" << err.where.line()
              << " " << err.where.function_name() << "\n";
}

inline void print_stats(const std::string& name, const mxpool::pool::pool_stats& stats)
{
    std::cout << name << ": idle=" << stats.idle_connections
              << " busy=" << stats.busy_connections
              << " created=" << stats.connections_created
              << " hit_rate=" << (stats.hit_rate() * 100) << "%\n";
}
