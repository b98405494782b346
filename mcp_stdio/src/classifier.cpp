#include "classifier.hpp"

#include "json_codec.hpp"

#include <nlohmann/json.hpp>

namespace mcp {

Message classify(const std::string& line) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& exc) {
        return ParseFailure{exc.what()};
    }

    try {
        return codec::decode_request(root);
    } catch (const codec::DecodeError& request_error) {
        try {
            return codec::decode_notification(root);
        } catch (const codec::DecodeError& notification_error) {
            // report whichever shape the sender was evidently aiming for
            if (codec::find_key(root, "id")) {
                return ParseFailure{request_error.what()};
            }
            return ParseFailure{notification_error.what()};
        }
    }
}

} // namespace mcp
