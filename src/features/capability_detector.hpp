#ifndef CAPABILITY_DETECTOR_HPP
#define CAPABILITY_DETECTOR_HPP

#include "core/errors.hpp"
#include "core/models.hpp"
#include "platform/iw_backend.hpp"

#include <vector>

class CapabilityDetector {
public:
    explicit CapabilityDetector(IwBackend backend = IwBackend());

    Result<std::vector<WirelessInterface>> detect() const;

private:
    IwBackend m_backend;
};

#endif
