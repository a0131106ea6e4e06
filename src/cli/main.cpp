#include "crossword_csp/model.hpp"
#include "crossword_csp/puzzle.hpp"
#include "crossword_csp/render.hpp"
#include "crossword_csp/solver.hpp"
#include "crossword_csp/word_list.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

std::atomic<bool> g_timeout_flag{false};
crossword_csp::Solver* g_current_solver = nullptr;

void timeout_handler(int) {
    g_timeout_flag = true;
    if (g_current_solver) {
        g_current_solver->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [-s] [-v] [-t SEC] [-n NODES] [--no-ac3] [--no-mac] [--no-lcv]"
              << " <structure> <words> [output]\n";
    std::cerr << "  -s        Print solver statistics to stderr\n";
    std::cerr << "  -v        Verbose mode (print presolve/search progress)\n";
    std::cerr << "  -t SEC    Timeout in seconds\n";
    std::cerr << "  -n NODES  Search node limit\n";
    std::cerr << "  --no-ac3  Skip arc consistency before search\n";
    std::cerr << "  --no-mac  Skip propagation after each assignment\n";
    std::cerr << "  --no-lcv  Try values in word order instead of least-constraining first\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const crossword_csp::Solver& solver) {
    if (!g_print_stats) return;
    const auto& s = solver.stats();
    std::cerr << "% Stats: nodes=" << s.node_count
              << " fails=" << s.fail_count
              << " max_depth=" << s.max_depth
              << " revisions=" << s.revise_count
              << " pruned=" << s.pruned_count
              << "\n";
}

int main(int argc, char* argv[]) {
    std::vector<const char*> positional;
    int timeout_sec = 0;
    long node_limit = 0;
    bool use_ac3 = true;
    bool use_mac = true;
    bool use_lcv = true;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            timeout_sec = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            node_limit = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--no-ac3") == 0) {
            use_ac3 = false;
        } else if (std::strcmp(argv[i], "--no-mac") == 0) {
            use_mac = false;
        } else if (std::strcmp(argv[i], "--no-lcv") == 0) {
            use_lcv = false;
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            positional.push_back(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (positional.size() < 2 || positional.size() > 3) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto puzzle = crossword_csp::load_puzzle(positional[0]);
        auto words = crossword_csp::read_word_list_file(positional[1]);
        crossword_csp::Model model(puzzle, std::move(words));

        crossword_csp::Solver solver;
        solver.set_verbose(g_verbose);
        solver.set_arc_consistency(use_ac3);
        solver.set_maintain_arc_consistency(use_mac);
        solver.set_lcv(use_lcv);
        if (node_limit > 0) {
            solver.set_node_limit(static_cast<size_t>(node_limit));
        }
        g_current_solver = &solver;

        // Setup timeout
        if (timeout_sec > 0) {
            std::signal(SIGALRM, timeout_handler);
            alarm(timeout_sec);
        }

        auto assignment = solver.solve(model);
        g_current_solver = nullptr;
        print_stats(solver);

        if (assignment) {
            crossword_csp::print_assignment(std::cout, *puzzle, *assignment);
            if (positional.size() == 3) {
                crossword_csp::save_assignment(positional[2], *puzzle, *assignment);
            }
        } else if (g_timeout_flag) {
            std::cout << "Unknown (timeout).\n";
        } else if (solver.last_result() == crossword_csp::SearchResult::UNKNOWN) {
            std::cout << "Unknown (search stopped).\n";
        } else {
            std::cout << "No solution.\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
