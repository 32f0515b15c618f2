#pragma once

#include "../../base/logger_adapter.hpp"

#include <string>
#include <vector>

class capture_adapter : public base::logger_adapter {
public:
    struct record {
        base::log_level level;
        std::string channel;
        std::string message;
    };

    const std::string name() const override {
        return "capture";
    }

    void log(base::log_level level, const std::string& channel, const std::string& message) override {
        records.push_back({level, channel, message});
    }

    std::vector<record> records;
};
