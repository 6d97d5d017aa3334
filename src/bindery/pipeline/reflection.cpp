#include <set>
#include <map>
#include <print>
#include <tuple>
#include <format>
#include <unordered_map>
#include <spirv_reflect.h>
#include <vulkan/vulkan.hpp>
#include "bindery/core/error.hpp"
#include "bindery/device/bindless.hpp"
#include "bindery/pipeline/reflection.hpp"

namespace bindery {
namespace {
auto read_string(std::span<const uint32_t> words) -> std::string {
	std::string str;
	for (uint32_t word: words) {
		for (uint32_t i = 0; i < 4; i++) {
			char c = (char)((word >> (i * 8)) & 0xff);
			if (c == '\0') return str;
			str.push_back(c);
		}
	}
	return str;
}

// Walks the raw instruction stream for what spirv-reflect does not report directly:
// struct shapes behind PhysicalStorageBuffer pointers and descriptor blocks made of pointers.
struct SpirvTypes {
	struct Type {
		SpvOp op;
		std::vector<uint32_t> operands;
	};
	struct Member {
		std::string name;
		uint32_t offset = 0;
		uint32_t matrix_stride = 0;
	};

	void parse(std::span<const uint32_t> code) {
		if (code.size() < 5 || code[0] != SpvMagicNumber) {
			throw Error(Errc::eInvalidBytecode, "missing SPIR-V header");
		}
		for (size_t i = 5; i < code.size();) {
			uint32_t word_count = code[i] >> SpvWordCountShift;
			uint32_t opcode = code[i] & SpvOpCodeMask;
			if (word_count == 0 || i + word_count > code.size()) {
				throw Error(Errc::eInvalidBytecode, std::format("truncated instruction at word {}", i));
			}
			auto operands = code.subspan(i + 1, word_count - 1);
			parse_instruction(opcode, operands);
			i += word_count;
		}
	}
	void parse_instruction(uint32_t opcode, std::span<const uint32_t> operands) {
		switch ((SpvOp)opcode) {
			case SpvOpName:
				if (operands.size() >= 1) _names[operands[0]] = read_string(operands.subspan(1));
				break;
			case SpvOpMemberName:
				if (operands.size() >= 2) member(operands[0], operands[1]).name = read_string(operands.subspan(2));
				break;
			case SpvOpDecorate:
				if (operands.size() < 3) break;
				switch ((SpvDecoration)operands[1]) {
					case SpvDecorationArrayStride: _array_strides[operands[0]] = operands[2]; break;
					case SpvDecorationDescriptorSet: _sets[operands[0]] = operands[2]; break;
					case SpvDecorationBinding: _bindings[operands[0]] = operands[2]; break;
					default: break;
				}
				break;
			case SpvOpMemberDecorate:
				if (operands.size() < 4) break;
				switch ((SpvDecoration)operands[2]) {
					case SpvDecorationOffset: member(operands[0], operands[1]).offset = operands[3]; break;
					case SpvDecorationMatrixStride: member(operands[0], operands[1]).matrix_stride = operands[3]; break;
					default: break;
				}
				break;
			case SpvOpTypeBool:
			case SpvOpTypeInt:
			case SpvOpTypeFloat:
			case SpvOpTypeVector:
			case SpvOpTypeMatrix:
			case SpvOpTypeArray:
			case SpvOpTypeRuntimeArray:
			case SpvOpTypeStruct:
			case SpvOpTypePointer:
				if (operands.size() < 1) break;
				_types[operands[0]] = { (SpvOp)opcode, std::vector<uint32_t>(operands.begin() + 1, operands.end()) };
				if (opcode == SpvOpTypePointer) _pointer_order.push_back(operands[0]);
				break;
			case SpvOpConstant:
				if (operands.size() >= 3) _constants[operands[1]] = operands[2];
				break;
			case SpvOpVariable:
				if (operands.size() >= 3) _variables.emplace_back(operands[1], operands[0]);
				break;
			default: break;
		}
	}
	auto member(uint32_t type, uint32_t index) -> Member& {
		auto& members = _members[type];
		if (members.size() <= index) members.resize(index + 1);
		return members[index];
	}
	auto find(uint32_t id) const -> const Type* {
		auto it = _types.find(id);
		return it == _types.end() ? nullptr : &it->second;
	}
	auto is_reference(uint32_t id) const -> bool {
		auto* type_p = find(id);
		return type_p && type_p->op == SpvOpTypePointer && type_p->operands.size() >= 2
			&& (SpvStorageClass)type_p->operands[0] == SpvStorageClassPhysicalStorageBuffer;
	}

	auto size_of(uint32_t id, uint32_t matrix_stride = 0) const -> uint32_t {
		auto* type_p = find(id);
		if (!type_p) return 0;
		auto& ops = type_p->operands;
		// malformed types count as empty
		size_t required = 0;
		switch (type_p->op) {
			case SpvOpTypeInt:
			case SpvOpTypeFloat:
			case SpvOpTypeRuntimeArray: required = 1; break;
			case SpvOpTypeVector:
			case SpvOpTypeMatrix:
			case SpvOpTypeArray:
			case SpvOpTypePointer: required = 2; break;
			default: break;
		}
		if (ops.size() < required) return 0;
		switch (type_p->op) {
			case SpvOpTypeBool: return 4;
			case SpvOpTypeInt:
			case SpvOpTypeFloat: return ops[0] / 8;
			case SpvOpTypeVector: return ops[1] * size_of(ops[0]);
			case SpvOpTypeMatrix: return ops[1] * (matrix_stride > 0 ? matrix_stride : size_of(ops[0]));
			case SpvOpTypeArray: {
				auto length_it = _constants.find(ops[1]);
				uint32_t length = length_it == _constants.end() ? 0 : length_it->second;
				auto stride_it = _array_strides.find(id);
				return length * (stride_it == _array_strides.end() ? size_of(ops[0]) : stride_it->second);
			}
			case SpvOpTypeRuntimeArray: return 0;
			case SpvOpTypeStruct: return shape_of(id).size();
			case SpvOpTypePointer: return (SpvStorageClass)ops[0] == SpvStorageClassPhysicalStorageBuffer ? 8 : 0;
			default: return 0;
		}
	}
	auto shape_of(uint32_t struct_id) const -> BlockShape {
		BlockShape shape;
		auto name_it = _names.find(struct_id);
		if (name_it != _names.end()) shape.name = name_it->second;
		auto* type_p = find(struct_id);
		if (!type_p) return shape;

		auto members_it = _members.find(struct_id);
		for (uint32_t i = 0; i < type_p->operands.size(); i++) {
			Member decorations;
			if (members_it != _members.end() && i < members_it->second.size()) decorations = members_it->second[i];
			shape.members.push_back({
				.name = decorations.name,
				.offset = decorations.offset,
				.size = size_of(type_p->operands[i], decorations.matrix_stride),
			});
		}
		return shape;
	}

	// structs reached through buffer references, one per name
	auto buffer_references() const -> std::vector<BlockShape> {
		std::vector<BlockShape> shapes;
		for (uint32_t pointer_id: _pointer_order) {
			if (!is_reference(pointer_id)) continue;
			uint32_t pointee = find(pointer_id)->operands[1];
			auto* pointee_p = find(pointee);
			if (!pointee_p || pointee_p->op != SpvOpTypeStruct) continue;

			BlockShape shape = shape_of(pointee);
			if (shape.name.empty()) continue;
			auto same_name = [&](const BlockShape& other) { return other.name == shape.name; };
			auto it = std::find_if(shapes.begin(), shapes.end(), same_name);
			if (it == shapes.end()) shapes.push_back(std::move(shape));
			else if (!it->same_layout(shape)) {
				throw Error(Errc::eLayoutMismatch, std::format("buffer reference {} is declared with two different layouts", shape.name));
			}
		}
		return shapes;
	}
	// (set, binding) of blocks whose members are all buffer references
	auto pointer_tables() const -> std::set<std::pair<uint32_t, uint32_t>> {
		std::set<std::pair<uint32_t, uint32_t>> tables;
		for (auto [variable_id, pointer_id]: _variables) {
			auto* pointer_p = find(pointer_id);
			if (!pointer_p || pointer_p->op != SpvOpTypePointer || pointer_p->operands.size() < 2) continue;
			auto storage_class = (SpvStorageClass)pointer_p->operands[0];
			if (storage_class != SpvStorageClassUniform && storage_class != SpvStorageClassStorageBuffer) continue;

			auto* block_p = find(pointer_p->operands[1]);
			if (!block_p || block_p->op != SpvOpTypeStruct || block_p->operands.empty()) continue;
			bool all_references = std::all_of(block_p->operands.begin(), block_p->operands.end(),
				[&](uint32_t member_type) { return is_reference(member_type); });
			if (!all_references) continue;

			auto set_it = _sets.find(variable_id);
			auto binding_it = _bindings.find(variable_id);
			if (set_it == _sets.end() || binding_it == _bindings.end()) continue;
			tables.emplace(set_it->second, binding_it->second);
		}
		return tables;
	}

	std::unordered_map<uint32_t, std::string> _names;
	std::unordered_map<uint32_t, std::vector<Member>> _members;
	std::unordered_map<uint32_t, uint32_t> _array_strides;
	std::unordered_map<uint32_t, uint32_t> _sets;
	std::unordered_map<uint32_t, uint32_t> _bindings;
	std::unordered_map<uint32_t, uint32_t> _constants;
	std::unordered_map<uint32_t, Type> _types;
	std::vector<uint32_t> _pointer_order;
	std::vector<std::pair<uint32_t /*variable*/, uint32_t /*pointer type*/>> _variables;
};

void check(SpvReflectResult result) {
	if (result == SPV_REFLECT_RESULT_SUCCESS) return;
	throw Error(Errc::eInvalidBytecode, std::format("shader reflection error: {}", (uint32_t)result));
}
auto get_kind(SpvReflectDescriptorType type) -> BindingKind {
	switch (type) {
		case SPV_REFLECT_DESCRIPTOR_TYPE_SAMPLER: return BindingKind::eSampler;
		case SPV_REFLECT_DESCRIPTOR_TYPE_SAMPLED_IMAGE: return BindingKind::eSampledImage;
		case SPV_REFLECT_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER: return BindingKind::eCombinedImageSampler;
		case SPV_REFLECT_DESCRIPTOR_TYPE_STORAGE_IMAGE: return BindingKind::eStorageImage;
		case SPV_REFLECT_DESCRIPTOR_TYPE_UNIFORM_TEXEL_BUFFER: return BindingKind::eUniformTexelBuffer;
		case SPV_REFLECT_DESCRIPTOR_TYPE_STORAGE_TEXEL_BUFFER: return BindingKind::eStorageTexelBuffer;
		case SPV_REFLECT_DESCRIPTOR_TYPE_UNIFORM_BUFFER: return BindingKind::eUniformBuffer;
		case SPV_REFLECT_DESCRIPTOR_TYPE_STORAGE_BUFFER: return BindingKind::eStorageBuffer;
		case SPV_REFLECT_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC: return BindingKind::eUniformBufferDynamic;
		case SPV_REFLECT_DESCRIPTOR_TYPE_STORAGE_BUFFER_DYNAMIC: return BindingKind::eStorageBufferDynamic;
		case SPV_REFLECT_DESCRIPTOR_TYPE_INPUT_ATTACHMENT: return BindingKind::eInputAttachment;
		case SPV_REFLECT_DESCRIPTOR_TYPE_ACCELERATION_STRUCTURE_KHR: return BindingKind::eAccelerationStructure;
		default:
			throw Error(Errc::eInvalidBytecode, std::format("unknown descriptor type {}", (uint32_t)type));
	}
}
auto get_reflected_bindings(const spv_reflect::ShaderModule& module) -> std::vector<SpvReflectDescriptorBinding*> {
	uint32_t bindings_n = 0;
	check(module.EnumerateDescriptorBindings(&bindings_n, nullptr));
	std::vector<SpvReflectDescriptorBinding*> bindings(bindings_n);
	check(module.EnumerateDescriptorBindings(&bindings_n, bindings.data()));
	return bindings;
}
auto get_bindings(const spv_reflect::ShaderModule& module, const SpirvTypes& types, vk::ShaderStageFlags stage)
-> std::vector<ReflectedBinding> {
	auto pointer_tables = types.pointer_tables();
	std::vector<ReflectedBinding> bindings;
	for (auto* reflected_p: get_reflected_bindings(module)) {
		ReflectedBinding binding {
			.set = reflected_p->set,
			.binding = reflected_p->binding,
			.kind = get_kind(reflected_p->descriptor_type),
			.count = reflected_p->count,
			.stages = stage,
			.name = reflected_p->name ? reflected_p->name : "",
		};
		// runtime arrays and the "u_" prefix mark unbounded arrays
		bool runtime_array = reflected_p->type_description && reflected_p->type_description->op == SpvOpTypeRuntimeArray;
		if (binding.count == 0 || runtime_array || binding.name.starts_with("u_")) {
			binding.count = ReflectedBinding::count_unbounded;
		}
		if (binding.kind == BindingKind::eUniformBuffer && pointer_tables.contains({ binding.set, binding.binding })) {
			binding.kind = BindingKind::eBufferReference;
		}
		// the "_dyn" suffix selects dynamic offsets, SPIR-V cannot express them
		else if (binding.name.ends_with("_dyn")) {
			if (binding.kind == BindingKind::eStorageBuffer) binding.kind = BindingKind::eStorageBufferDynamic;
			else if (binding.kind == BindingKind::eUniformBuffer) binding.kind = BindingKind::eUniformBufferDynamic;
		}

		// bindless convention, the table sizes these arrays whatever the shader declares.
		// anything else at these slots is rejected when merging
		bool texture_slot = binding.set == 0 && binding.binding == BindlessRegistry::texture_binding;
		bool sampler_slot = binding.set == 0 && binding.binding == BindlessRegistry::sampler_binding;
		if ((texture_slot && binding.kind == BindingKind::eSampledImage) || (sampler_slot && binding.kind == BindingKind::eSampler)) {
			binding.bindless = true;
			binding.count = ReflectedBinding::count_unbounded;
		}

		if (binding.kind == BindingKind::eSampler && !binding.bindless) {
			binding.immutable_sampler = SamplerDesc::from_name(binding.name);
			if (!binding.immutable_sampler && binding.name.starts_with("sampler_")) {
				std::println("unrecognized sampler name: {}", binding.name);
			}
		}
		bindings.push_back(std::move(binding));
	}
	std::sort(bindings.begin(), bindings.end(), [](auto& a, auto& b) {
		return std::tie(a.set, a.binding) < std::tie(b.set, b.binding);
	});
	return bindings;
}
auto get_push_constants(const spv_reflect::ShaderModule& module, vk::ShaderStageFlags stage)
-> std::vector<PushConstantRange> {
	uint32_t blocks_n = 0;
	check(module.EnumeratePushConstantBlocks(&blocks_n, nullptr));
	std::vector<SpvReflectBlockVariable*> blocks(blocks_n);
	check(module.EnumeratePushConstantBlocks(&blocks_n, blocks.data()));

	std::vector<PushConstantRange> ranges;
	for (auto* block_p: blocks) {
		PushConstantRange range { .offset = block_p->offset, .size = block_p->size, .stages = stage };
		if (block_p->member_count > 0) {
			uint32_t beg = std::numeric_limits<uint32_t>::max();
			uint32_t end = 0;
			for (uint32_t i = 0; i < block_p->member_count; i++) {
				auto& member = block_p->members[i];
				range.members.push_back({
					.name = member.name ? member.name : "",
					.offset = member.offset,
					.size = member.size,
				});
				beg = std::min(beg, member.offset);
				end = std::max(end, member.offset + member.size);
			}
			range.offset = beg;
			range.size = end - beg;
		}
		ranges.push_back(std::move(range));
	}
	return ranges;
}
auto get_vertex_inputs(const spv_reflect::ShaderModule& module) -> std::vector<VertexInput> {
	uint32_t inputs_n = 0;
	check(module.EnumerateInputVariables(&inputs_n, nullptr));
	std::vector<SpvReflectInterfaceVariable*> vars(inputs_n);
	check(module.EnumerateInputVariables(&inputs_n, vars.data()));

	std::vector<VertexInput> inputs;
	inputs.reserve(vars.size());
	for (auto* input_p: vars) {
		if (input_p->decoration_flags & SPV_REFLECT_DECORATION_BUILT_IN) continue;
		inputs.push_back({ .location = input_p->location, .format = (vk::Format)input_p->format });
	}
	// sort attributes by location
	auto sorter = [](auto& a, auto& b) { return a.location < b.location; };
	std::sort(inputs.begin(), inputs.end(), sorter);
	return inputs;
}
} // namespace

auto to_string(BindingKind kind) -> std::string_view {
	switch (kind) {
		case BindingKind::eSampledImage: return "sampled image";
		case BindingKind::eSampler: return "sampler";
		case BindingKind::eStorageBuffer: return "storage buffer";
		case BindingKind::eBufferReference: return "buffer reference";
		case BindingKind::eUniformBuffer: return "uniform buffer";
		case BindingKind::eStorageImage: return "storage image";
		case BindingKind::eCombinedImageSampler: return "combined image sampler";
		case BindingKind::eUniformTexelBuffer: return "uniform texel buffer";
		case BindingKind::eStorageTexelBuffer: return "storage texel buffer";
		case BindingKind::eUniformBufferDynamic: return "dynamic uniform buffer";
		case BindingKind::eStorageBufferDynamic: return "dynamic storage buffer";
		case BindingKind::eInputAttachment: return "input attachment";
		case BindingKind::eAccelerationStructure: return "acceleration structure";
	}
	return "unknown";
}
auto to_descriptor_type(BindingKind kind) -> vk::DescriptorType {
	switch (kind) {
		case BindingKind::eSampledImage: return vk::DescriptorType::eSampledImage;
		case BindingKind::eSampler: return vk::DescriptorType::eSampler;
		case BindingKind::eStorageBuffer: return vk::DescriptorType::eStorageBuffer;
		case BindingKind::eUniformBuffer: return vk::DescriptorType::eUniformBuffer;
		case BindingKind::eStorageImage: return vk::DescriptorType::eStorageImage;
		case BindingKind::eCombinedImageSampler: return vk::DescriptorType::eCombinedImageSampler;
		case BindingKind::eBufferReference: return vk::DescriptorType::eUniformBuffer;
		case BindingKind::eUniformTexelBuffer: return vk::DescriptorType::eUniformTexelBuffer;
		case BindingKind::eStorageTexelBuffer: return vk::DescriptorType::eStorageTexelBuffer;
		case BindingKind::eUniformBufferDynamic: return vk::DescriptorType::eUniformBufferDynamic;
		case BindingKind::eStorageBufferDynamic: return vk::DescriptorType::eStorageBufferDynamic;
		case BindingKind::eInputAttachment: return vk::DescriptorType::eInputAttachment;
		case BindingKind::eAccelerationStructure: return vk::DescriptorType::eAccelerationStructureKHR;
	}
	return vk::DescriptorType::eUniformBuffer;
}

auto analyze(std::span<const uint32_t> code) -> ShaderReflection {
	// raw walk first, it rejects malformed modules before spirv-reflect sees them
	SpirvTypes types;
	types.parse(code);

	spv_reflect::ShaderModule module(code.size_bytes(), code.data());
	check(module.GetResult());

	ShaderReflection reflection;
	reflection.stage = (vk::ShaderStageFlagBits)module.GetShaderStage();
	if (const char* entry_p = module.GetEntryPointName()) reflection.entry_point = entry_p;
	reflection.bindings = get_bindings(module, types, reflection.stage);
	reflection.push_constants = get_push_constants(module, reflection.stage);
	reflection.buffer_references = types.buffer_references();
	if (reflection.stage == vk::ShaderStageFlagBits::eVertex) {
		reflection.vertex_inputs = get_vertex_inputs(module);
	}
	return reflection;
}
} // namespace bindery
