#include "arena.hpp"
#include "dablo/errors.hpp"
#include <atomic>
#include <functional>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace dablo;
using namespace dablo_ai;
using namespace dablo_arena;

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog
            << " [games] [styleA] [difficultyA] [styleB] [difficultyB] [threads] [move_limit]"
            << " [rows] [cols]\n"
            << "  style: smart | aggressive | defensive | random\n"
            << "  difficulty: easy | medium | hard\n";
}

int main(int argc, char* argv[]) {
  ArenaConfig cfg;
  cfg.npc_a.style = Style::Smart;
  cfg.npc_a.difficulty = Difficulty::Hard;
  cfg.npc_b.style = Style::Random;
  cfg.npc_b.difficulty = Difficulty::Medium;

  try {
    if (argc > 1) cfg.num_games = std::stoi(argv[1]);
    if (argc > 2) cfg.npc_a.style = parse_style(argv[2]);
    if (argc > 3) cfg.npc_a.difficulty = parse_difficulty(argv[3]);
    if (argc > 4) cfg.npc_b.style = parse_style(argv[4]);
    if (argc > 5) cfg.npc_b.difficulty = parse_difficulty(argv[5]);
    if (argc > 6) cfg.num_threads = std::stoi(argv[6]);
    if (argc > 7) cfg.game.move_limit = std::stoi(argv[7]);
    if (argc > 8) cfg.game.rows = std::stoi(argv[8]);
    if (argc > 9) cfg.game.cols = std::stoi(argv[9]);
    if (cfg.num_games < 1 || cfg.num_threads < 1) {
      throw ConfigError("games and threads must be positive");
    }
    cfg.game.validate();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    print_usage(argv[0]);
    return 1;
  }

  std::cout << "========================================\n";
  std::cout << "Dablo NPC Arena\n";
  std::cout << "========================================\n";
  std::cout << "A: " << to_string(cfg.npc_a.style) << " (" << to_string(cfg.npc_a.difficulty) << ")\n";
  std::cout << "B: " << to_string(cfg.npc_b.style) << " (" << to_string(cfg.npc_b.difficulty) << ")\n";
  std::cout << "Playing " << cfg.num_games << " games on " << cfg.num_threads
            << " threads, " << cfg.game.rows << "x" << cfg.game.cols << " board, move limit "
            << cfg.game.move_limit << "...\n";

  Tally tally;
  std::atomic<int> next_game{0};
  std::random_device rd;
  std::vector<std::thread> threads;
  std::vector<uint32_t> seeds;
  for (int t = 0; t < cfg.num_threads; ++t) seeds.push_back(rd());

  try {
    for (int t = 0; t < cfg.num_threads; ++t) {
      threads.emplace_back(worker, std::cref(cfg), seeds[t], std::ref(next_game), std::ref(tally),
                           std::ref(std::cout));
    }
  } catch (const std::exception& e) {
    std::cerr << "Failed to start worker threads: " << e.what() << "\n";
    next_game.store(cfg.num_games);
    for (auto& th : threads) th.join();
    return 1;
  }
  for (auto& th : threads) th.join();

  const int n = cfg.num_games;
  std::cout << "\n--- Results ---\n";
  std::cout << std::fixed << std::setprecision(1);
  std::cout << "A wins: " << tally.a_wins << " (" << 100.0 * tally.a_wins / n << "%)\n";
  std::cout << "B wins: " << tally.b_wins << " (" << 100.0 * tally.b_wins / n << "%)\n";
  std::cout << "Draws:  " << tally.draws << " (" << 100.0 * tally.draws / n << "%)\n";
  std::cout << "Average moves per game: " << static_cast<double>(tally.total_moves) / n << "\n";
  std::cout << "End reasons:";
  for (const auto& kv : tally.reasons) std::cout << " " << kv.first << "=" << kv.second;
  std::cout << "\n---------------\n";
  if (tally.failures > 0) {
    std::cerr << tally.failures << " worker(s) stopped on an error\n";
    return 1;
  }
  return 0;
}
