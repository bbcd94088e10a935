#include "./emit.hpp"

#include "./convert.hpp"

#include <scribe/error/errors.hpp>

#include <boost/leaf/exception.hpp>
#include <nlohmann/json.hpp>

using namespace scribe;

std::string scribe::emit_json(const value& val) {
    auto doc = value_as_nlohmann_json(val);
    try {
        return doc.dump();
    } catch (const nlohmann::json::type_error& err) {
        // 316: A string is not valid UTF-8
        if (err.id != 316) {
            throw;
        }
        BOOST_LEAF_THROW_EXCEPTION(e_unrepresentable{"string", "JSON strings must be valid UTF-8"});
    }
}
