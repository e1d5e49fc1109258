/**
 * Segue Engine - Analyze Example
 * 
 * Demonstrates analysis through the C API.
 */

#include "segue/segue.h"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <audio_file>\n";
        return 1;
    }
    
    std::string audio_file = argv[1];
    
    std::cout << "Segue Engine - Analyze Example\n";
    std::cout << "==============================\n\n";
    
    // In-memory cache, nothing is kept between runs
    SegueEngine* engine = segue_create(":memory:");
    if (!engine) {
        std::cerr << "Error: Failed to create engine\n";
        return 1;
    }
    
    std::cout << "Analyzing file: " << audio_file << "\n";
    
    SegueAnalysis analysis;
    int result = segue_analyze(engine, audio_file.c_str(), &analysis);
    if (result != SEGUE_OK) {
        std::cerr << "Error: " << segue_get_error(engine) << "\n";
        segue_destroy(engine);
        return 1;
    }
    
    std::cout << "  Loudness: " << analysis.integrated_lufs << " LUFS"
              << " (gain " << analysis.gain_adjustment_db << " dB)\n"
              << "  Peak:     " << analysis.true_peak_db << " dBFS\n"
              << "  BPM:      " << analysis.bpm
              << " (confidence " << analysis.beat_confidence << ")\n"
              << "  Meter:    " << analysis.time_signature << "\n"
              << "  Trim:     " << analysis.trim_start << " s / "
              << analysis.trim_end << " s\n";
    
    // A second request is served from the cache
    SegueCacheStats stats;
    if (segue_analyze(engine, audio_file.c_str(), &analysis) == SEGUE_OK &&
        segue_get_cache_stats(engine, &stats) == SEGUE_OK) {
        std::cout << "\nCache entries: " << stats.entries << "\n";
    }
    
    segue_destroy(engine);
    
    std::cout << "\nDone!\n";
    return 0;
}
