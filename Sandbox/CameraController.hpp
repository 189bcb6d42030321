#pragma once
#include "renderer/Camera.hpp"

namespace Wire3D
{
    /**
     * @brief Keyboard orbit around the origin.
     * Controls:
     * - Left / Right: orbit speed
     * - Up / Down: distance
     * - Page Up / Page Down: height
     * - Space: pause the orbit
     */
    class CameraController
    {
    public:
        CameraController( float radius, float height );

        void OnUpdate( Camera& camera, float dt );

        float GetAngle() const { return m_angle; }

    private:
        float m_radius;
        float m_height;
        float m_angle      = 0.0f;
        float m_orbitSpeed = 1.0f; // radians per second
        bool  m_paused     = false;
    };
} // namespace Wire3D
