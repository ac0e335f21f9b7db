#pragma once

#include "rowpager/rpc/method_registry.hpp"
#include "rowpager/session/session.hpp"

namespace rowpager::rpc {

// Registers tables, views, columns, execute, metadata, count, page, finish
// and quit against the given session. The session must outlive the registry.
void register_session_methods(MethodRegistry& registry, session::Session& session);

}  // namespace rowpager::rpc
