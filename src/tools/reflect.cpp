#include <print>
#include <vector>
#include <string>
#include <fstream>
#include <cstdint>
#include <filesystem>
#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_to_string.hpp>
#include "bindery/core/error.hpp"
#include "bindery/pipeline/layout.hpp"
#include "bindery/pipeline/reflection.hpp"

// prints the merged pipeline layout of a set of spir-v modules
namespace {
auto load_spirv(const std::filesystem::path& path) -> std::vector<uint32_t> {
	std::ifstream file(path, std::ios::binary | std::ios::ate);
	if (!file) throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory), path.string());
	auto byte_count = (size_t)file.tellg();
	std::vector<uint32_t> code(byte_count / sizeof(uint32_t));
	file.seekg(0);
	file.read(reinterpret_cast<char*>(code.data()), code.size() * sizeof(uint32_t));
	if (!file) throw std::system_error(std::make_error_code(std::errc::io_error), path.string());
	return code;
}
void print_members(const std::vector<bindery::BlockMember>& members) {
	for (auto& member: members) {
		std::println("\t\t+{:<4} {:>4}B  {}", member.offset, member.size, member.name);
	}
}
void print_layout(const bindery::PipelineLayoutSpec& spec) {
	std::println("layout {:016x}, {} set(s)", spec.hash, spec.set_count());
	for (auto& [set, bindings]: spec.sets) {
		for (auto& [binding, reflected]: bindings) {
			std::string count = reflected.unbounded() ? "unbounded" : std::to_string(reflected.count);
			std::println("\tset {} | binding {}: {} [{}] {}{} ({})",
				set, binding,
				bindery::to_string(reflected.kind), count,
				reflected.name,
				reflected.bindless ? " bindless" : "",
				vk::to_string(reflected.stages));
		}
	}
	for (auto& range: spec.push_constants) {
		std::println("\tpush constants {}..{} ({})", range.offset, range.offset + range.size, vk::to_string(range.stages));
		print_members(range.members);
	}
	for (auto& shape: spec.buffer_references) {
		std::println("\tbuffer reference {} ({}B)", shape.name, shape.size());
		print_members(shape.members);
	}
}
} // namespace

int main(int argc, char** argv) {
	if (argc < 2) {
		std::println("usage: {} <shader.spv>...", argv[0]);
		return 2;
	}
	try {
		std::vector<bindery::ShaderReflection> stages;
		for (int i = 1; i < argc; i++) {
			auto code = load_spirv(argv[i]);
			auto& reflection = stages.emplace_back(bindery::analyze(code));
			std::println("{}: {} \"{}\", {} vertex input(s)",
				argv[i], vk::to_string(reflection.stage), reflection.entry_point, reflection.vertex_inputs.size());
		}
		print_layout(bindery::build_layout(stages));
	}
	catch (const bindery::Error& error) {
		std::println("{}: {}", bindery::to_string(error.errc()), error.what());
		return 1;
	}
	catch (const std::system_error& error) {
		std::println("{}", error.what());
		return 1;
	}
	return 0;
}
