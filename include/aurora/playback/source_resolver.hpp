#pragma once

#include <memory>
#include <string>

#include <dpp/dpp.h>

#include "aurora/playback/playback_handle.hpp"

namespace aurora::playback {

class resolution_error : public dpp::exception {
public:
    using dpp::exception::exception;
};

/// Turns a user query (URL or search text) into a playable source for a
/// guild. Throws resolution_error when nothing playable comes back.
class source_resolver {
public:
    virtual ~source_resolver() = default;
    virtual std::unique_ptr<playback_handle> resolve(dpp::snowflake guild_id, const std::string& query) = 0;
};

} // namespace aurora::playback
