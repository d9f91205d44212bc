#include "pawn_tour/driver.hpp"
#include "pawn_tour/render.hpp"
#include "pawn_tour/options.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <random>
#include <stdexcept>
#include <cstdint>
#include <unistd.h>

std::atomic<bool> g_timeout_flag{false};
pawn_tour::TourDriver* g_current_driver = nullptr;

void timeout_handler(int) {
    g_timeout_flag = true;
    if (g_current_driver) {
        g_current_driver->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-n DIM] [-i ATTEMPTS] [-r SEED] [-q] [-s] [-v] [-t SEC]\n";
    std::cerr << "  -n DIM       Board dimension (default 10)\n";
    std::cerr << "  -i ATTEMPTS  Maximum number of attempts (default 100)\n";
    std::cerr << "  -r SEED      Random seed for starting positions\n";
    std::cerr << "  -q           Quiet mode (do not print the board after each step)\n";
    std::cerr << "  -s           Print statistics to stderr\n";
    std::cerr << "  -v           Verbose mode (print attempt progress)\n";
    std::cerr << "  -t SEC       Timeout in seconds\n";
}

bool g_print_stats = false;
bool g_verbose = false;
bool g_quiet = false;

void print_stats(const pawn_tour::TourDriver& driver, const pawn_tour::DriverResult& result) {
    if (!g_print_stats) return;
    const auto& s = driver.last_stats();
    std::cerr << "% Stats: attempts=" << result.attempts
              << " last_steps=" << s.steps
              << " degree_evals=" << s.degree_evaluations
              << " candidate_checks=" << s.candidate_checks
              << " elapsed_ms=" << result.elapsed_ms
              << "\n";
}

int main(int argc, char* argv[]) {
    pawn_tour::DriverConfig config;
    uint32_t seed = std::random_device{}();
    int timeout_sec = 0;

    try {
        // Parse command line arguments
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
                config.dimension = pawn_tour::parse_positive("-n", argv[++i]);
            } else if (std::strcmp(argv[i], "-i") == 0 && i + 1 < argc) {
                config.max_attempts = pawn_tour::parse_positive("-i", argv[++i]);
            } else if (std::strcmp(argv[i], "-r") == 0 && i + 1 < argc) {
                seed = pawn_tour::parse_seed(argv[++i]);
            } else if (std::strcmp(argv[i], "-q") == 0) {
                g_quiet = true;
            } else if (std::strcmp(argv[i], "-s") == 0) {
                g_print_stats = true;
            } else if (std::strcmp(argv[i], "-v") == 0) {
                g_verbose = true;
            } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
                timeout_sec = pawn_tour::parse_positive("-t", argv[++i]);
            } else if (std::strcmp(argv[i], "-h") == 0 ||
                       std::strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // Setup timeout
    if (timeout_sec > 0) {
        std::signal(SIGALRM, timeout_handler);
        alarm(timeout_sec);
    }

    try {
        pawn_tour::TourDriver driver(config, pawn_tour::RandomStartSource(seed));
        driver.set_verbose(g_verbose);
        g_current_driver = &driver;

        std::cout << "Welcome the board dimensions are: " << config.dimension
                  << " X " << config.dimension << "\n\n";

        if (!g_quiet) {
            driver.set_step_callback([](const pawn_tour::Board& board,
                                        const pawn_tour::Cell&, int step) {
                std::cout << "Step: " << step << "\n\n"
                          << pawn_tour::format_board(board) << "\n";
                return true;
            });
        }

        driver.set_attempt_callback([](int, const pawn_tour::Cell& start,
                                       const pawn_tour::TourResult* result) {
            if (!result) {
                std::cout << "The initial position for the pawn is: "
                          << pawn_tour::format_cell(start) << "\n";
            } else if (result->success) {
                std::cout << "Found path for pawn\n\n";
            } else {
                std::cout << "Cannot find path for pawn\n"
                          << "retrying...\n\n";
            }
        });

        auto result = driver.run();
        g_current_driver = nullptr;
        print_stats(driver, result);

        if (g_timeout_flag && !result.found) {
            std::cout << "Stopped by timeout\n";
        }
        std::cout << "Finished after " << result.elapsed_ms << "ms\n";
        return result.found ? 0 : 1;
    } catch (const std::exception& e) {
        g_current_driver = nullptr;
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
