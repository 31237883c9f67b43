#include "hearth/core/constants.hpp"
#include "hearth/services/config_service.hpp"
#include "hearth/services/house_optimizer.hpp"

#include <charconv>
#include <iostream>
#include <string_view>

using namespace hearth;

namespace {

auto print_report(const batch_input &input, const solve_result &result) -> void
{
	const auto graph = relationship_graph::build(input.relationships);

	std::vector<std::string> caps;
	for (int c : input.capacities)
		caps.push_back(std::to_string(c));

	std::cout << "Số phòng các nhà: [" << util::join(caps, ", ") << "]\n";
	std::cout << "Tổng số liên kết đạt được: " << result.score << "\n";

	for (std::size_t i = 0; i < result.houses.size(); ++i) {
		const auto &house = result.houses[i];
		std::cout << "Nhà " << i + 1 << " (" << house.size() << "/" << input.capacities[i] << " phòng) - " << graph.connections_within(house) << " liên kết:\n";
		std::cout << "  " << (house.empty() ? std::string(constants::text::empty_house) : util::join(house, ", ")) << "\n";
	}

	if (!result.unrecognized.empty()) {
		std::cout << "Không tồn tại trong relationships: " << util::join(result.unrecognized, ", ") << "\n";
	}
	if (!result.dropped.empty()) {
		std::cout << "Bị loại do vượt quá sức chứa (" << result.dropped.size() << "): " << util::join(result.dropped, ", ") << "\n";
	}

	std::cout << "(" << result.trials_run << " trials" << (result.early_stopped ? ", early stop" : "") << ", best strategy: "
						<< (result.best_strategy ? to_string(*result.best_strategy) : std::string_view{"template"}) << ")\n";
}

} // namespace

int main(int argc, char **argv)
{
	if (argc < 2) {
		std::cerr << "Usage: hearth_solve <input.json> [seed]\n";
		return 2;
	}

	std::uint64_t seed = 0;
	if (argc > 2) {
		const std::string_view arg = argv[2];
		if (auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), seed); ec != std::errc{} || ptr != arg.data() + arg.size()) {
			std::cerr << "Invalid seed: " << arg << "\n";
			return 2;
		}
	}

	auto input = config_service::load_batch(argv[1]);
	if (!input) {
		std::cerr << input.error().what() << "\n";
		return 1;
	}

	optimizer_config config{};
	config.capacities = input->capacities;
	config.seed = seed;

	auto result = solve_house_assignment(input->relationships, input->people, std::move(config));
	if (!result) {
		std::cerr << result.error().what() << "\n";
		return 1;
	}

	print_report(*input, *result);
	return 0;
}
