// rotator_generate: write a random banner file for load testing
//
// Usage: rotator_generate <rows> [--words FILE] [--seed N]
//
// Each row: http://banners.com/banner<i>.jpg;<1..1000>;<1..10 categories>
// Categories are drawn without replacement from FILE (one word per line)
// or from a built-in list.

#include <rotator/args.hpp>
#include <rotator/config_loader.hpp>
#include <cstdint>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

static const char* const DEFAULT_WORDS[] = {
    "auto", "books", "cinema", "cooking", "design", "finance", "fitness",
    "gadgets", "games", "garden", "health", "history", "home", "jobs",
    "kids", "music", "news", "outdoors", "pets", "photo", "realty",
    "science", "shopping", "sport", "startups", "style", "tech", "travel",
    "tv", "weather"
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <rows> [options]\n"
              << "Options:\n"
              << "  --words FILE   Category word list, one per line\n"
              << "  --seed N       Random seed\n"
              << "  --help, -h     Show this help\n";
}

int main(int argc, char* argv[]) {
    long long rows = -1;
    std::string words_path;
    bool seeded = false;
    unsigned long long seed = 0;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--words") == 0 && i + 1 < argc) {
            words_path = argv[++i];
        } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            if (!rotator::parse_unsigned(argv[++i], UINT64_MAX, seed)) {
                std::cerr << "Invalid seed: " << argv[i] << "\n";
                return 1;
            }
            seeded = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (rows < 0 && argv[i][0] != '-') {
            char* end = nullptr;
            rows = std::strtoll(argv[i], &end, 10);
            if (*end != '\0' || rows < 0) {
                std::cerr << "Invalid row count: " << argv[i] << "\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (rows < 0) {
        print_usage(argv[0]);
        return 1;
    }

    std::vector<std::string> words;
    if (!words_path.empty()) {
        std::ifstream in(words_path);
        if (!in) {
            std::cerr << "Cannot open word list: " << words_path << "\n";
            return 1;
        }
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty() && line.find(rotator::ConfigLoader::DELIMITER) == std::string::npos) {
                words.push_back(line);
            }
        }
    } else {
        words.assign(std::begin(DEFAULT_WORDS), std::end(DEFAULT_WORDS));
    }

    if (words.empty()) {
        std::cerr << "Word list is empty\n";
        return 1;
    }

    std::mt19937_64 rng(seeded ? seed : std::random_device{}());
    std::uniform_int_distribution<int> amount(1, 1000);
    std::uniform_int_distribution<size_t> count(1, std::min<size_t>(10, words.size()));

    std::vector<std::string> picked;
    for (long long i = 0; i < rows; ++i) {
        picked.clear();
        std::sample(words.begin(), words.end(), std::back_inserter(picked), count(rng), rng);

        std::cout << "http://banners.com/banner" << i << ".jpg"
                  << rotator::ConfigLoader::DELIMITER << amount(rng);
        for (const auto& w : picked) {
            std::cout << rotator::ConfigLoader::DELIMITER << w;
        }
        std::cout << '\n';
    }
    return 0;
}
