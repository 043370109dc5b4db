#pragma once

#include <functional>
#include <govcat/catalog/catalog_engine.h>
#include <govcat/mcp/dispatcher.h>

namespace govcat::mcp {

// instructions/*, integrity/verify, usage/*
void registerCatalogHandlers(Dispatcher& dispatcher, catalog::CatalogEngine& engine);

struct ServiceHandlerEnv {
    // Source for diagnostics/handshake; absent outside a running server
    std::function<json()> handshakeDiagnostics;
};

// health/check, meta/tools, metrics/snapshot, batch, diagnostics/handshake
void registerServiceHandlers(Dispatcher& dispatcher, ServiceHandlerEnv env = {});

// Read-only actions plus mutations and the capabilities/batch meta actions
const std::vector<std::string>& dispatchActions();

} // namespace govcat::mcp
