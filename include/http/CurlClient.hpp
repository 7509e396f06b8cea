#pragma once

#include "http/Client.hpp"

#include <chrono>

namespace cn::http {

class CurlClient final : public Client {
public:
    explicit CurlClient(std::chrono::seconds connectTimeout = std::chrono::seconds(30));

    Response perform(const Request& req) override;

private:
    std::chrono::seconds connectTimeout_;
};

}
