#pragma once
#include <limits>
#include <cstdint>
#include <cstddef>
#include <glm/glm.hpp>
#include "bindery/pipeline/reflection.hpp"

namespace bindery {
// PBR material record reached through a buffer reference named MaterialBuffer.
// Textures are bindless slot indices, no_texture marks an unused one.
struct MaterialBlock {
	static constexpr uint32_t no_texture = std::numeric_limits<uint32_t>::max();
	enum Flags: uint32_t {
		eFlipNormalMapY = 1 << 0,
		eDoubleSided = 1 << 1,
	};

	auto static shape() -> BlockShape {
		return BlockShape {
			.name = "MaterialBuffer",
			.members = {
				{ "base_color", offsetof(MaterialBlock, base_color), sizeof(glm::vec4) },
				{ "emissive", offsetof(MaterialBlock, emissive), sizeof(glm::vec4) },
				{ "perceptual_roughness", offsetof(MaterialBlock, perceptual_roughness), sizeof(float) },
				{ "metallic", offsetof(MaterialBlock, metallic), sizeof(float) },
				{ "reflectance", offsetof(MaterialBlock, reflectance), sizeof(float) },
				{ "depth_bias", offsetof(MaterialBlock, depth_bias), sizeof(float) },
				{ "base_color_texture", offsetof(MaterialBlock, base_color_texture), sizeof(uint32_t) },
				{ "metallic_roughness_texture", offsetof(MaterialBlock, metallic_roughness_texture), sizeof(uint32_t) },
				{ "normal_map_texture", offsetof(MaterialBlock, normal_map_texture), sizeof(uint32_t) },
				{ "occlusion_texture", offsetof(MaterialBlock, occlusion_texture), sizeof(uint32_t) },
				{ "emissive_texture", offsetof(MaterialBlock, emissive_texture), sizeof(uint32_t) },
				{ "flags", offsetof(MaterialBlock, flags), sizeof(uint32_t) },
			},
		};
	}

	glm::vec4 base_color = { 1, 1, 1, 1 };
	glm::vec4 emissive = { 0, 0, 0, 0 };
	float perceptual_roughness = 0.5f;
	float metallic = 0.0f;
	float reflectance = 0.5f;
	float depth_bias = 0.0f;
	uint32_t base_color_texture = no_texture;
	uint32_t metallic_roughness_texture = no_texture;
	uint32_t normal_map_texture = no_texture;
	uint32_t occlusion_texture = no_texture;
	uint32_t emissive_texture = no_texture;
	uint32_t flags = 0;
};
} // namespace bindery
