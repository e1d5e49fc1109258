/**
 * Segue CLI - Analyze Tool
 *
 * Analyzes audio files (or reads them from the cache) and prints the
 * loudness, silence/fade and tempo metrics used for transitions.
 *
 * Usage: segue-analyze [options] <file>...
 */

#include "segue/segue.h"
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <cstring>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <file>...\n"
              << "\nOptions:\n"
              << "  -d, --database <path>  Cache database path (default: segue_cache.db)\n"
              << "  -s, --stats            Print cache statistics\n"
              << "      --clear-cache      Remove all cached analyses first\n"
              << "  -h, --help             Show this help\n";
}

void print_analysis(const std::string& path, const SegueAnalysis& a) {
    std::cout << path << (a.is_default ? "  (analysis failed, defaults)" : "") << "\n"
              << std::fixed << std::setprecision(2)
              << "  Loudness:  " << a.integrated_lufs << " LUFS integrated, "
              << a.short_term_lufs << " short-term, " << a.momentary_lufs << " momentary\n"
              << "             range " << a.loudness_range << " LU, true peak "
              << a.true_peak_db << " dBFS, gain " << a.gain_adjustment_db << " dB\n"
              << "  Silence:   start " << a.start_silence << " s (fade-in " << a.start_fade
              << " s), end " << a.end_silence << " s (fade-out " << a.end_fade << " s)\n"
              << "             encoder delay " << a.encoder_delay << ", padding " << a.encoder_padding
              << (a.has_gapless_markers ? ", gapless" : "") << "\n"
              << "  Tempo:     " << a.bpm << " BPM (confidence " << a.beat_confidence << "), "
              << a.time_signature << ", " << a.beat_count << " beats, "
              << a.downbeat_count << " downbeats, first downbeat " << a.first_downbeat << " s\n"
              << "  Trim:      " << a.trim_start << " s head, " << a.trim_end << " s tail\n";
}

int main(int argc, char* argv[]) {
    std::string db_path = "segue_cache.db";
    std::vector<std::string> files;
    bool show_stats = false;
    bool clear_cache = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--database") == 0) {
            if (i + 1 < argc) {
                db_path = argv[++i];
            } else {
                std::cerr << "Error: -d requires a path argument\n";
                return 1;
            }
        } else if (strcmp(argv[i], "-s") == 0 || strcmp(argv[i], "--stats") == 0) {
            show_stats = true;
        } else if (strcmp(argv[i], "--clear-cache") == 0) {
            clear_cache = true;
        } else if (argv[i][0] != '-') {
            files.push_back(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (files.empty() && !show_stats && !clear_cache) {
        std::cerr << "Error: No files specified\n";
        print_usage(argv[0]);
        return 1;
    }

    // Create engine
    SegueEngine* engine = segue_create(db_path.c_str());
    if (!engine) {
        std::cerr << "Error: Failed to create engine\n";
        return 1;
    }

    if (clear_cache && segue_clear_cache(engine) != SEGUE_OK) {
        std::cerr << "Error: " << segue_get_error(engine) << "\n";
        segue_destroy(engine);
        return 1;
    }

    int failures = 0;
    for (const auto& file : files) {
        SegueAnalysis analysis;
        SegueError err = segue_analyze(engine, file.c_str(), &analysis);
        if (err == SEGUE_ERROR_FILE_NOT_FOUND || err == SEGUE_ERROR_INVALID_ARGUMENT) {
            std::cerr << "Error: " << segue_get_error(engine) << "\n";
            failures++;
            continue;
        }
        if (err != SEGUE_OK) {
            failures++;
        }
        print_analysis(file, analysis);
    }

    if (show_stats) {
        SegueCacheStats stats;
        if (segue_get_cache_stats(engine, &stats) == SEGUE_OK) {
            std::cout << "\nCache: " << stats.entries << " entries, "
                      << stats.total_size_bytes << " bytes of audio analyzed\n";
        }
    }

    segue_destroy(engine);
    return failures > 0 ? 1 : 0;
}
