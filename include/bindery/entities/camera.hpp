#pragma once
#include <cstddef>
#include <glm/glm.hpp>
#include "bindery/pipeline/reflection.hpp"

namespace bindery {
// Per-frame camera record, shaders reach it through a buffer reference named CameraBuffer.
// Column-major mat4 and vec4 members keep the scalar and std430 layouts identical.
struct CameraBlock {
	auto static from_view(const glm::mat4& view, const glm::mat4& proj, const glm::vec3& position) -> CameraBlock {
		glm::mat4 view_proj = proj * view;
		return CameraBlock {
			.view_proj = view_proj,
			.inverse_view_proj = glm::inverse(view_proj),
			.view = view,
			.inverse_view = glm::inverse(view),
			.proj = proj,
			.inverse_proj = glm::inverse(proj),
			.world_position = glm::vec4(position, 1.0f),
		};
	}
	auto static shape() -> BlockShape {
		return BlockShape {
			.name = "CameraBuffer",
			.members = {
				{ "view_proj", offsetof(CameraBlock, view_proj), sizeof(glm::mat4) },
				{ "inverse_view_proj", offsetof(CameraBlock, inverse_view_proj), sizeof(glm::mat4) },
				{ "view", offsetof(CameraBlock, view), sizeof(glm::mat4) },
				{ "inverse_view", offsetof(CameraBlock, inverse_view), sizeof(glm::mat4) },
				{ "proj", offsetof(CameraBlock, proj), sizeof(glm::mat4) },
				{ "inverse_proj", offsetof(CameraBlock, inverse_proj), sizeof(glm::mat4) },
				{ "world_position", offsetof(CameraBlock, world_position), sizeof(glm::vec4) },
			},
		};
	}

	glm::mat4 view_proj;
	glm::mat4 inverse_view_proj;
	glm::mat4 view;
	glm::mat4 inverse_view;
	glm::mat4 proj;
	glm::mat4 inverse_proj;
	glm::vec4 world_position;
};
} // namespace bindery
