#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace aeon::json
{

    /**
     * Deterministic serialization of structured messages for MAC input.
     *
     * Object keys are sorted (byte-wise) at every nesting level, array order is
     * preserved and no insignificant whitespace is emitted. A bare top-level
     * string is returned verbatim, without quotes or escaping, so a DID string
     * and a structured request are both stable signing inputs.
     *
     * The encoder is total: invalid UTF-8 inside strings is replaced rather than
     * rejected.
     */
    class CanonicalEncoder
    {
    public:
        /**
         * Canonicalize a structured value
         * @param value Message to canonicalize
         * @return Canonical byte string
         */
        static std::string canonicalize(const nlohmann::json &value);

        /**
         * Canonicalize an insertion-ordered value; keys are still sorted
         */
        static std::string canonicalize(const nlohmann::ordered_json &value);

        /**
         * Parse JSON text and canonicalize
         * @param json_str Input JSON text
         * @return Canonical byte string or ParsingError
         */
        static Result<std::string> canonicalize_string(const std::string &json_str);
    };

} // namespace aeon::json
