#include <gtest/gtest.h>
#include "spirv_builder.hpp"
#include "bindery/core/error.hpp"
#include "bindery/pipeline/layout.hpp"
#include "bindery/pipeline/reflection.hpp"
#include "bindery/entities/camera.hpp"

using namespace bindery;

namespace {
// set 0 texture and sampler arrays the way the bindless table declares them
void declare_bindless(spirv::Builder& builder) {
	builder.binding(0, 0, SpvStorageClassUniformConstant, builder.t_runtime_array(builder.t_image()), "u_textures");
	builder.binding(0, 1, SpvStorageClassUniformConstant, builder.t_runtime_array(builder.t_sampler()), "u_samplers");
}
auto camera_struct(spirv::Builder& builder) -> uint32_t {
	uint32_t mat4 = builder.t_mat(builder.t_vec(builder.t_float(), 4), 4);
	uint32_t vec4 = builder.t_vec(builder.t_float(), 4);
	return builder.t_struct("CameraBuffer", {
		{ "view_proj", mat4, 0 },
		{ "inverse_view_proj", mat4, 64 },
		{ "view", mat4, 128 },
		{ "inverse_view", mat4, 192 },
		{ "proj", mat4, 256 },
		{ "inverse_proj", mat4, 320 },
		{ "world_position", vec4, 384 },
	});
}
void expect_errc(Errc errc, auto&& fn) {
	try {
		fn();
		ADD_FAILURE() << "expected " << to_string(errc);
	}
	catch (const Error& error) {
		EXPECT_EQ(error.errc(), errc) << error.what();
	}
}
} // namespace

TEST(Reflection, RecognizesTheBindlessConvention) {
	spirv::Builder builder(SpvExecutionModelFragment);
	declare_bindless(builder);
	auto reflection = analyze(builder.build());

	EXPECT_EQ(reflection.stage, vk::ShaderStageFlagBits::eFragment);
	EXPECT_EQ(reflection.entry_point, "main");
	ASSERT_EQ(reflection.bindings.size(), 2u);
	auto& textures = reflection.bindings[0];
	EXPECT_EQ(textures.binding, 0u);
	EXPECT_EQ(textures.kind, BindingKind::eSampledImage);
	EXPECT_TRUE(textures.unbounded());
	EXPECT_TRUE(textures.bindless);
	auto& samplers = reflection.bindings[1];
	EXPECT_EQ(samplers.binding, 1u);
	EXPECT_EQ(samplers.kind, BindingKind::eSampler);
	EXPECT_TRUE(samplers.bindless);
	EXPECT_FALSE(samplers.immutable_sampler);
}

TEST(Reflection, SizedGlobalArraysAreTakenOverByTheTable) {
	// declared with a literal size at the reserved slots
	spirv::Builder fragment(SpvExecutionModelFragment);
	fragment.binding(0, 0, SpvStorageClassUniformConstant, fragment.t_array(fragment.t_image(), 1024), "textures");
	fragment.binding(0, 1, SpvStorageClassUniformConstant, fragment.t_array(fragment.t_sampler(), 16), "samplers");
	auto sized = analyze(fragment.build());

	ASSERT_EQ(sized.bindings.size(), 2u);
	EXPECT_TRUE(sized.bindings[0].bindless);
	EXPECT_TRUE(sized.bindings[0].unbounded());
	EXPECT_TRUE(sized.bindings[1].bindless);
	EXPECT_TRUE(sized.bindings[1].unbounded());

	// merges with a stage using runtime arrays
	spirv::Builder vertex(SpvExecutionModelVertex);
	declare_bindless(vertex);
	std::vector<ShaderReflection> stages { analyze(vertex.build()), sized };
	auto spec = build_layout(stages);
	ASSERT_NE(spec.find(0, 0), nullptr);
	EXPECT_TRUE(spec.find(0, 0)->unbounded());
	EXPECT_EQ(spec.find(0, 0)->stages, vk::ShaderStageFlagBits::eVertex | vk::ShaderStageFlagBits::eFragment);
	EXPECT_TRUE(spec.global_set_compatible());

	// other kinds at the reserved slots stay violations
	spirv::Builder storage(SpvExecutionModelGLCompute);
	storage.binding(0, 0, SpvStorageClassUniformConstant, storage.t_array(storage.t_image(2), 8), "images");
	auto storage_reflection = analyze(storage.build());
	EXPECT_FALSE(storage_reflection.bindings[0].bindless);
	expect_errc(Errc::eReservedBindingViolation, [&] { build_layout({ &storage_reflection, 1 }); });
}

TEST(Reflection, TexelBuffersAndInputAttachments) {
	spirv::Builder builder(SpvExecutionModelFragment);
	builder.binding(1, 0, SpvStorageClassUniformConstant, builder.t_image(1, SpvDimBuffer), "lookup");
	builder.binding(1, 1, SpvStorageClassUniformConstant, builder.t_image(2, SpvDimBuffer), "histogram");
	builder.binding(1, 2, SpvStorageClassUniformConstant, builder.t_image(2, SpvDimSubpassData), "gbuffer");
	auto reflection = analyze(builder.build());

	ASSERT_EQ(reflection.bindings.size(), 3u);
	EXPECT_EQ(reflection.bindings[0].kind, BindingKind::eUniformTexelBuffer);
	EXPECT_EQ(reflection.bindings[1].kind, BindingKind::eStorageTexelBuffer);
	EXPECT_EQ(reflection.bindings[2].kind, BindingKind::eInputAttachment);
	EXPECT_EQ(to_descriptor_type(reflection.bindings[0].kind), vk::DescriptorType::eUniformTexelBuffer);
	EXPECT_EQ(to_descriptor_type(reflection.bindings[1].kind), vk::DescriptorType::eStorageTexelBuffer);
	EXPECT_EQ(to_descriptor_type(reflection.bindings[2].kind), vk::DescriptorType::eInputAttachment);
}

TEST(Reflection, DynamicSuffixSelectsDynamicOffsets) {
	spirv::Builder builder(SpvExecutionModelGLCompute);
	uint32_t f32 = builder.t_float();
	uint32_t particles = builder.t_struct("Particles", { { "mass", f32, 0 } });
	uint32_t params = builder.t_struct("Params", { { "scale", f32, 0 } });
	builder.binding(1, 0, SpvStorageClassStorageBuffer, particles, "particles_dyn");
	builder.binding(1, 1, SpvStorageClassStorageBuffer, particles, "particles");
	builder.binding(1, 2, SpvStorageClassUniform, params, "params_dyn");
	auto reflection = analyze(builder.build());

	ASSERT_EQ(reflection.bindings.size(), 3u);
	EXPECT_EQ(reflection.bindings[0].kind, BindingKind::eStorageBufferDynamic);
	EXPECT_EQ(reflection.bindings[1].kind, BindingKind::eStorageBuffer);
	EXPECT_EQ(reflection.bindings[2].kind, BindingKind::eUniformBufferDynamic);
	EXPECT_EQ(to_descriptor_type(reflection.bindings[0].kind), vk::DescriptorType::eStorageBufferDynamic);
	EXPECT_EQ(to_descriptor_type(reflection.bindings[2].kind), vk::DescriptorType::eUniformBufferDynamic);
}

TEST(Reflection, BoundedArraysKeepTheirCount) {
	spirv::Builder builder(SpvExecutionModelGLCompute);
	builder.binding(1, 0, SpvStorageClassUniformConstant, builder.t_array(builder.t_image(2), 4), "images");
	builder.binding(1, 1, SpvStorageClassUniformConstant, builder.t_array(builder.t_image(), 8), "u_shadow_maps");
	auto reflection = analyze(builder.build());

	EXPECT_EQ(reflection.stage, vk::ShaderStageFlagBits::eCompute);
	ASSERT_EQ(reflection.bindings.size(), 2u);
	EXPECT_EQ(reflection.bindings[0].kind, BindingKind::eStorageImage);
	EXPECT_EQ(reflection.bindings[0].count, 4u);
	// the prefix marks an array sized at layout creation
	EXPECT_TRUE(reflection.bindings[1].unbounded());
	EXPECT_FALSE(reflection.bindings[1].bindless);
}

TEST(Reflection, SamplerNamesDescribeImmutableSamplers) {
	spirv::Builder builder(SpvExecutionModelFragment);
	builder.binding(1, 0, SpvStorageClassUniformConstant, builder.t_sampler(), "sampler_nncb");
	auto reflection = analyze(builder.build());

	ASSERT_EQ(reflection.bindings.size(), 1u);
	auto& sampler = reflection.bindings[0];
	ASSERT_TRUE(sampler.immutable_sampler);
	EXPECT_EQ(sampler.immutable_sampler->filter, vk::Filter::eNearest);
	EXPECT_EQ(sampler.immutable_sampler->mipmap, vk::SamplerMipmapMode::eNearest);
	EXPECT_EQ(sampler.immutable_sampler->address, vk::SamplerAddressMode::eClampToBorder);
}

TEST(Reflection, PointerTablesAreBufferReferences) {
	spirv::Builder builder(SpvExecutionModelVertex);
	uint32_t camera = camera_struct(builder);
	uint32_t camera_ptr = builder.t_pointer(SpvStorageClassPhysicalStorageBuffer, camera);
	uint32_t table = builder.t_struct("Pointers", { { "camera", camera_ptr, 0 } });
	builder.binding(1, 0, SpvStorageClassUniform, table, "pointers");
	auto reflection = analyze(builder.build());

	ASSERT_EQ(reflection.bindings.size(), 1u);
	EXPECT_EQ(reflection.bindings[0].kind, BindingKind::eBufferReference);
	EXPECT_EQ(to_descriptor_type(reflection.bindings[0].kind), vk::DescriptorType::eUniformBuffer);

	ASSERT_EQ(reflection.buffer_references.size(), 1u);
	auto& shape = reflection.buffer_references[0];
	EXPECT_EQ(shape.name, "CameraBuffer");
	ASSERT_EQ(shape.members.size(), 7u);
	EXPECT_EQ(shape.members[1].offset, 64u);
	EXPECT_EQ(shape.members[1].size, 64u);
	EXPECT_EQ(shape.members[6].size, 16u);
	EXPECT_EQ(shape.size(), 400u);
}

TEST(Reflection, HostCameraMatchesItsShaderLayout) {
	spirv::Builder builder(SpvExecutionModelVertex);
	uint32_t camera_ptr = builder.t_pointer(SpvStorageClassPhysicalStorageBuffer, camera_struct(builder));
	builder.push_constant(builder.t_struct("Push", { { "camera", camera_ptr, 0 } }), "push");
	ShaderReflection reflection = analyze(builder.build());

	auto spec = build_layout({ &reflection, 1 });
	EXPECT_TRUE(validate_block(spec, CameraBlock::shape()));

	// a host record with a field moved is rejected
	auto moved = CameraBlock::shape();
	moved.members.back().offset += 16;
	expect_errc(Errc::eLayoutMismatch, [&] { validate_block(spec, moved); });
	// records no stage references are not checked
	EXPECT_FALSE(validate_block(spec, BlockShape { .name = "Unused" }));
}

TEST(Reflection, ConflictingReferenceLayoutsInOneModule) {
	spirv::Builder builder(SpvExecutionModelGLCompute);
	uint32_t f32 = builder.t_float();
	uint32_t a = builder.t_struct("Particles", { { "mass", f32, 0 }, { "charge", f32, 4 } });
	uint32_t b = builder.t_struct("Particles", { { "mass", f32, 0 }, { "charge", f32, 8 } });
	uint32_t a_ptr = builder.t_pointer(SpvStorageClassPhysicalStorageBuffer, a);
	uint32_t b_ptr = builder.t_pointer(SpvStorageClassPhysicalStorageBuffer, b);
	builder.push_constant(builder.t_struct("Push", { { "a", a_ptr, 0 }, { "b", b_ptr, 8 } }), "push");

	expect_errc(Errc::eLayoutMismatch, [&] { analyze(builder.build()); });
}

TEST(Reflection, PushConstantRangeCoversItsMembers) {
	spirv::Builder builder(SpvExecutionModelFragment);
	uint32_t f32 = builder.t_float();
	uint32_t vec4 = builder.t_vec(f32, 4);
	builder.push_constant(builder.t_struct("Push", { { "exposure", f32, 0 }, { "tint", vec4, 16 } }), "push");
	auto reflection = analyze(builder.build());

	ASSERT_EQ(reflection.push_constants.size(), 1u);
	auto& range = reflection.push_constants[0];
	EXPECT_EQ(range.offset, 0u);
	EXPECT_EQ(range.size, 32u);
	EXPECT_EQ(range.stages, vk::ShaderStageFlagBits::eFragment);
	ASSERT_EQ(range.members.size(), 2u);
	EXPECT_EQ(range.members[1].name, "tint");
	EXPECT_EQ(range.members[1].offset, 16u);
}

TEST(Reflection, VertexInputsSortedByLocation) {
	spirv::Builder builder(SpvExecutionModelVertex);
	uint32_t f32 = builder.t_float();
	builder.input(1, builder.t_vec(f32, 2), "in_uv");
	builder.input(0, builder.t_vec(f32, 3), "in_position");
	auto reflection = analyze(builder.build());

	ASSERT_EQ(reflection.vertex_inputs.size(), 2u);
	EXPECT_EQ(reflection.vertex_inputs[0].location, 0u);
	EXPECT_EQ(reflection.vertex_inputs[0].format, vk::Format::eR32G32B32Sfloat);
	EXPECT_EQ(reflection.vertex_inputs[1].location, 1u);
	EXPECT_EQ(reflection.vertex_inputs[1].format, vk::Format::eR32G32Sfloat);
}

TEST(Reflection, MalformedBytecode) {
	spirv::Builder builder(SpvExecutionModelFragment);
	declare_bindless(builder);
	auto code = builder.build();

	auto bad_magic = code;
	bad_magic[0] = 0xdeadbeef;
	expect_errc(Errc::eInvalidBytecode, [&] { analyze(bad_magic); });

	// cut the last instruction in half
	auto truncated = code;
	truncated.resize(truncated.size() - 1);
	truncated.back() = (8u << SpvWordCountShift) | SpvOpReturn;
	expect_errc(Errc::eInvalidBytecode, [&] { analyze(truncated); });

	expect_errc(Errc::eInvalidBytecode, [&] { analyze(std::vector<uint32_t>{ SpvMagicNumber }); });
}
