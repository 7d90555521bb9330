#pragma once

#include "cadstring/core/types.h"
#include <cmath>

// World-to-screen mapping owned by the host's viewport.
class CoordinateProjector {
public:
    virtual ~CoordinateProjector() = default;
    virtual ScreenPoint worldToScreen(double x, double y, double z) const = 0;
};

// Plan view: uniform scale about a screen-space origin, world Y up, Z ignored.
class PlanViewProjector : public CoordinateProjector {
public:
    PlanViewProjector(float viewX, float viewY, float viewScale)
        : viewX_(viewX), viewY_(viewY), viewScale_(normalizeScale(viewScale)) {}

    ScreenPoint worldToScreen(double x, double y, double z) const override {
        (void)z;
        return ScreenPoint{
            static_cast<float>(x * viewScale_ + viewX_),
            static_cast<float>(-y * viewScale_ + viewY_),
        };
    }

    void setView(float viewX, float viewY, float viewScale) {
        viewX_ = viewX;
        viewY_ = viewY;
        viewScale_ = normalizeScale(viewScale);
    }

private:
    static float normalizeScale(float s) {
        return (s > 1e-6f && std::isfinite(s)) ? s : 1.0f;
    }

    float viewX_;
    float viewY_;
    float viewScale_;
};
