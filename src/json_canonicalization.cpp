#include "aeon/json_canonicalization.hpp"
#include <algorithm>
#include <format>
#include <string_view>
#include <utility>
#include <vector>

namespace aeon::json
{

    namespace
    {
        // nlohmann's own string escaping; invalid UTF-8 becomes U+FFFD
        void serialize_string(const std::string &str, std::string &output)
        {
            output += nlohmann::json(str).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        template <typename Json>
        void serialize_value(const Json &value, std::string &output);

        template <typename Json>
        void serialize_object(const Json &obj, std::string &output)
        {
            output += '{';

            // Sort keys lexicographically (UTF-8 byte order)
            std::vector<std::pair<std::string_view, const Json *>> sorted_items;
            sorted_items.reserve(obj.size());
            for (auto it = obj.begin(); it != obj.end(); ++it)
            {
                sorted_items.emplace_back(it.key(), &it.value());
            }
            std::sort(sorted_items.begin(), sorted_items.end(),
                      [](const auto &a, const auto &b)
                      { return a.first < b.first; });

            bool first = true;
            for (const auto &[key, value] : sorted_items)
            {
                if (!first)
                {
                    output += ',';
                }
                first = false;

                serialize_string(std::string(key), output);
                output += ':';
                serialize_value(*value, output);
            }

            output += '}';
        }

        template <typename Json>
        void serialize_array(const Json &arr, std::string &output)
        {
            output += '[';

            bool first = true;
            for (const auto &item : arr)
            {
                if (!first)
                {
                    output += ',';
                }
                first = false;
                serialize_value(item, output);
            }

            output += ']';
        }

        template <typename Json>
        void serialize_value(const Json &value, std::string &output)
        {
            switch (value.type())
            {
            case nlohmann::json::value_t::null:
                output += "null";
                break;

            case nlohmann::json::value_t::boolean:
                output += value.template get<bool>() ? "true" : "false";
                break;

            case nlohmann::json::value_t::number_integer:
            case nlohmann::json::value_t::number_unsigned:
            case nlohmann::json::value_t::number_float:
                // shortest round-trip form; NaN and infinities become null
                output += value.dump();
                break;

            case nlohmann::json::value_t::string:
                serialize_string(value.template get_ref<const std::string &>(), output);
                break;

            case nlohmann::json::value_t::array:
                serialize_array(value, output);
                break;

            case nlohmann::json::value_t::object:
                serialize_object(value, output);
                break;

            default:
                // binary and discarded values have no textual form
                output += "null";
                break;
            }
        }

        template <typename Json>
        std::string canonicalize_impl(const Json &value)
        {
            if (value.is_string())
            {
                return value.template get<std::string>();
            }
            std::string output;
            serialize_value(value, output);
            return output;
        }
    } // namespace

    std::string CanonicalEncoder::canonicalize(const nlohmann::json &value)
    {
        return canonicalize_impl(value);
    }

    std::string CanonicalEncoder::canonicalize(const nlohmann::ordered_json &value)
    {
        return canonicalize_impl(value);
    }

    Result<std::string> CanonicalEncoder::canonicalize_string(const std::string &json_str)
    {
        try
        {
            auto parsed = nlohmann::json::parse(json_str);
            return canonicalize(parsed);
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(AeonError::parsing(
                std::format("JSON parse error: {}", e.what())));
        }
    }

} // namespace aeon::json
