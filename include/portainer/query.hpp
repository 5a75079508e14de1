/**
 * @file query.hpp
 * @brief Query string and filter encoding for the Portainer C++ SDK
 */

#ifndef PORTAINER_QUERY_HPP
#define PORTAINER_QUERY_HPP

#include "types.hpp"
#include <string>

namespace portainer {

/**
 * Percent-encode a query component
 */
std::string url_encode(const std::string& value);

/**
 * Render a query value as text
 *
 * Strings are used verbatim, booleans become "1"/"0" and numbers their
 * decimal representation.
 */
std::string query_value_to_string(const json& value);

/**
 * Copy of the parameters without null-valued entries
 */
QueryParams drop_null_params(const QueryParams& query);

/**
 * Encode parameters as "k1=v1&k2=v2", skipping null values
 * @return Encoded query without the leading '?'
 */
std::string encode_query(const QueryParams& query);

/**
 * Encode a filter mapping for the Docker "filters" query parameter
 *
 * Each value becomes a list of strings, booleans rendered as "true"/"false",
 * and the whole mapping is serialized as a JSON object.
 */
std::string convert_filters(const Filters& filters);

/**
 * Query value for a kill signal: numbers stay integers, names pass through
 */
json signal_param(const Signal& signal);

} // namespace portainer

#endif // PORTAINER_QUERY_HPP
