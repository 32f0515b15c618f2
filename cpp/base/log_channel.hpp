#pragma once

#include <string>

namespace base {

class log_channel
{
public:
    [[nodiscard]] std::string channel() const
    {
        return channel_;
    }

    static const log_channel generic;
    static const log_channel codec;
    static const log_channel stream;

private:
    explicit log_channel(std::string channel)
        : channel_(std::move(channel))
    {
    }

    std::string channel_;
};

} // namespace base
