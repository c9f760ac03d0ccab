#pragma once

#include "providers/Provider.hpp"
#include <memory>

namespace mcp_orch {

/**
 * @brief Create the provider implementation selected by configuration
 *
 * This is the only place that branches on ProviderKind.
 *
 * @throws std::invalid_argument if the configuration is incomplete
 */
std::shared_ptr<IProvider> make_provider(const ProviderConfig& config);

} // namespace mcp_orch
