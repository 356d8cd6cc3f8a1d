#pragma once

#include "core/overlay/OverlayState.hpp"

namespace dsc {

/// Draw target for the status overlay. Implementations must not block.
class IOverlayRenderer {
public:
    virtual ~IOverlayRenderer() = default;

    virtual void render(const OverlayParams& params) = 0;
    virtual void hide() = 0;
    /// Re-assert the overlay above other windows.
    virtual void raise() = 0;
};

} // namespace dsc
