module;

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

module Graphics:Camera.Impl;
import :Camera;

namespace Graphics
{
    glm::vec3 Camera::GetForward() const
    {
        const float yaw = glm::radians(Yaw);
        const float pitch = glm::radians(Pitch);
        return glm::normalize(glm::vec3(std::cos(pitch) * std::cos(yaw),
                                        std::sin(pitch),
                                        -std::cos(pitch) * std::sin(yaw)));
    }

    glm::vec3 Camera::GetRight() const
    {
        return glm::normalize(glm::cross(GetForward(), GetUp()));
    }

    glm::mat4 Camera::GetViewMatrix() const
    {
        return glm::lookAtRH(Position, Position + GetForward(), GetUp());
    }

    glm::mat4 Camera::GetProjectionMatrix() const
    {
        glm::mat4 projection = glm::perspectiveRH_ZO(glm::radians(Fov), AspectRatio, Near, Far);
        projection[1][1] *= -1.0f;
        return projection;
    }

    void Camera::ApplyDelta(const CameraDelta& delta)
    {
        // Movement uses the basis from before this delta's rotation.
        Position += GetForward() * delta.Forward + GetRight() * delta.Right + GetUp() * delta.Up;

        Yaw += delta.Yaw;
        Pitch = std::clamp(Pitch + delta.Pitch, -kMaxPitch, kMaxPitch);
        Fov = std::clamp(Fov + delta.Fov, kMinFov, kMaxFov);
    }

    void Camera::SetAspect(uint32_t width, uint32_t height)
    {
        if (height > 0) AspectRatio = static_cast<float>(width) / static_cast<float>(height);
    }

    CameraUniformData BuildCameraUniformData(const Camera& camera)
    {
        CameraUniformData data;
        data.ViewPosition = glm::vec4(camera.Position, 1.0f);
        data.ViewProj = camera.GetViewProjection();
        return data;
    }
}
