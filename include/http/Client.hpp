#pragma once

#include "http/types.hpp"

namespace cn::http {

class Client {
public:
    virtual ~Client() = default;

    // Performs one blocking round trip. Transport failures are reported through
    // Response::transportError rather than thrown.
    virtual Response perform(const Request& req) = 0;
};

}
