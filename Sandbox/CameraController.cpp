#include "CameraController.hpp"

#include "platform/Input.hpp"
#include <GLFW/glfw3.h>
#include <algorithm>
#include <cmath>

namespace Wire3D
{
    CameraController::CameraController( float radius, float height )
        : m_radius( radius )
        , m_height( height )
    {
    }

    void CameraController::OnUpdate( Camera& camera, float dt )
    {
        if( Input::WasKeyPressed( GLFW_KEY_SPACE ) )
            m_paused = !m_paused;

        if( Input::IsKeyPressed( GLFW_KEY_LEFT ) )
            m_orbitSpeed -= dt;
        if( Input::IsKeyPressed( GLFW_KEY_RIGHT ) )
            m_orbitSpeed += dt;

        // Zoom proportional to distance for smooth approach
        if( Input::IsKeyPressed( GLFW_KEY_UP ) )
            m_radius -= m_radius * dt;
        if( Input::IsKeyPressed( GLFW_KEY_DOWN ) )
            m_radius += m_radius * dt;
        m_radius = std::max( m_radius, 0.5f );

        if( Input::IsKeyPressed( GLFW_KEY_PAGE_UP ) )
            m_height += 2.0f * dt;
        if( Input::IsKeyPressed( GLFW_KEY_PAGE_DOWN ) )
            m_height -= 2.0f * dt;

        if( !m_paused )
            m_angle += m_orbitSpeed * dt;

        Vec3 eye( std::cos( m_angle ) * m_radius, m_height, std::sin( m_angle ) * m_radius );
        if( camera.SetPose( eye, Vec3( 0.0f ), Vec3( 0.0f, 1.0f, 0.0f ) ) != Result::SUCCESS )
            W3D_WARN( "CameraController: pose rejected, keeping the previous one" );
    }
} // namespace Wire3D
