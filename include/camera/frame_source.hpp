#pragma once

#include <optional>
#include <string>

#include "core/types.hpp"

namespace jugsync {

// Camera collaborator. Depth-capable devices fill AlignedFrame::depth_m
// pixel-aligned to color; color-only sources leave it empty.
class IFrameSource {
public:
    virtual ~IFrameSource() = default;

    virtual bool open(std::string& error) = 0;
    virtual bool grab(AlignedFrame& out, std::string& error) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual std::optional<CameraIntrinsics> intrinsics() const = 0;
    virtual std::string description() const = 0;
};

}  // namespace jugsync
