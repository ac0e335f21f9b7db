#include "rowpager/rpc/session_methods.hpp"

#include <cstdint>
#include <limits>
#include <vector>

namespace rowpager::rpc {

namespace {

[[nodiscard]] Json tables_to_json(const std::vector<session::TableInfo>& tables)
{
    Json result = Json::array();
    for (const auto& table : tables) {
        result.push_back({{"catalog", table.catalog}, {"schema", table.schema}, {"table", table.table}});
    }
    return result;
}

[[nodiscard]] std::int64_t to_page_size(const Json& value)
{
    if (value.is_number_unsigned()) {
        const auto size = value.get<std::uint64_t>();
        if (size > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        return static_cast<std::int64_t>(size);
    }
    return value.get<std::int64_t>();
}

}  // namespace

void register_session_methods(MethodRegistry& registry, session::Session& session)
{
    registry.register_method("tables", {}, [&session](const Arguments&) {
        return tables_to_json(session.tables());
    });

    registry.register_method("views", {}, [&session](const Arguments&) {
        return tables_to_json(session.views());
    });

    registry.register_method("columns",
                             {{"catalog", ParamType::String}, {"schema", ParamType::String}, {"table", ParamType::String}},
                             [&session](const Arguments& args) {
                                 const auto columns = session.columns(args[0].get<std::string>(),
                                                                      args[1].get<std::string>(),
                                                                      args[2].get<std::string>());
                                 Json result = Json::array();
                                 for (const auto& column : columns) {
                                     result.push_back({{"catalog", column.catalog},
                                                       {"schema", column.schema},
                                                       {"table", column.table},
                                                       {"column", column.column},
                                                       {"datatype", column.datatype}});
                                 }
                                 return result;
                             });

    registry.register_method("execute", {{"sql", ParamType::String}}, [&session](const Arguments& args) {
        session.execute(args[0].get<std::string>());
        return Json(true);
    });

    registry.register_method("metadata", {}, [&session](const Arguments&) {
        Json result = Json::array();
        for (const auto& column : session.metadata()) {
            result.push_back({{"column", column.name}, {"datatype", column.type_name}});
        }
        return result;
    });

    registry.register_method("count", {}, [&session](const Arguments&) {
        return Json(session.count());
    });

    registry.register_method("page", {{"max", ParamType::Integer}}, [&session](const Arguments& args) {
        Json result = Json::array();
        for (const auto& row : session.page(to_page_size(args[0]))) {
            Json named = Json::object();
            for (const auto& [column, value] : row) {
                named[column] = value;
            }
            result.push_back(std::move(named));
        }
        return result;
    });

    registry.register_method("finish", {}, [&session](const Arguments&) {
        session.finish();
        return Json(true);
    });

    registry.register_method("quit", {}, [&session](const Arguments&) {
        session.quit();
        return Json(true);
    });
}

}  // namespace rowpager::rpc
