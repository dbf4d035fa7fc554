/**
 * Cadence CLI - Radio Tool
 *
 * Starts a radio station for a user from a seed track, artist or genre and
 * prints the recommended queue with the reasons behind each pick.
 *
 * Usage: cadence-radio [options] --seed <track_id>
 */

#include "cadence/cadence.h"
#include <iostream>
#include <iomanip>
#include <string>
#include <cstdlib>
#include <cstring>

void print_usage(const char* program) {
    std::string default_db = "cadence.db";
#ifdef CADENCE_DEFAULT_DB_PATH
    default_db = CADENCE_DEFAULT_DB_PATH;
#endif

    std::cerr << "Usage: " << program << " [options] (--seed <track_id> | --artist <name> | --genre <name>)\n"
              << "\nOptions:\n"
              << "  -d, --database <path>  Database file path (default: " << default_db << ")\n"
              << "  -u, --user <id>        User whose taste to use (default: local)\n"
              << "  -n, --count <n>        Number of tracks to queue (default: 10)\n"
              << "  -v, --verbose          Print engine diagnostics\n"
              << "  --seed <track_id>      Start radio from a track\n"
              << "  --artist <name>        Start radio from an artist\n"
              << "  --genre <name>         Start radio from a genre\n"
              << "  -h, --help             Show this help\n";
}

int main(int argc, char* argv[]) {
#ifdef CADENCE_DEFAULT_DB_PATH
    std::string db_path = CADENCE_DEFAULT_DB_PATH;
#else
    std::string db_path = "cadence.db";
#endif
    std::string user_id = "local";
    std::string seed;
    CadenceSeedType seed_type = CADENCE_SEED_TRACK;
    int count = 10;
    bool verbose = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        bool has_value = i + 1 < argc;
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--database") == 0) {
            if (!has_value) {
                std::cerr << "Error: -d requires a path argument\n";
                return 1;
            }
            db_path = argv[++i];
        } else if (strcmp(argv[i], "-u") == 0 || strcmp(argv[i], "--user") == 0) {
            if (!has_value) {
                std::cerr << "Error: -u requires a user id\n";
                return 1;
            }
            user_id = argv[++i];
        } else if (strcmp(argv[i], "-n") == 0 || strcmp(argv[i], "--count") == 0) {
            if (!has_value) {
                std::cerr << "Error: -n requires a number\n";
                return 1;
            }
            count = std::atoi(argv[++i]);
            if (count <= 0) {
                std::cerr << "Error: count must be positive\n";
                return 1;
            }
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "--seed") == 0 || strcmp(argv[i], "--artist") == 0 ||
                   strcmp(argv[i], "--genre") == 0) {
            if (!has_value) {
                std::cerr << "Error: " << argv[i] << " requires a value\n";
                return 1;
            }
            if (strcmp(argv[i], "--artist") == 0) seed_type = CADENCE_SEED_ARTIST;
            else if (strcmp(argv[i], "--genre") == 0) seed_type = CADENCE_SEED_GENRE;
            else seed_type = CADENCE_SEED_TRACK;
            seed = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (seed.empty()) {
        std::cerr << "Error: No radio seed specified\n";
        print_usage(argv[0]);
        return 1;
    }

    cadence_set_log_level(verbose ? CADENCE_LOG_DEBUG : CADENCE_LOG_WARN);

    // Create engine
    CadenceEngine* engine = cadence_create(db_path.c_str());
    if (!engine) {
        std::cerr << "Error: Failed to open database " << db_path << "\n";
        return 1;
    }

    std::cout << "Library: " << cadence_get_track_count(engine) << " tracks\n";

    if (cadence_load_index(engine) != CADENCE_OK || cadence_load_user(engine, user_id.c_str()) != CADENCE_OK) {
        std::cerr << "Warning: " << cadence_get_error(engine) << "\n";
    }

    const char* seed_id = seed_type == CADENCE_SEED_TRACK ? seed.c_str() : nullptr;
    CadenceError err = cadence_start_radio(engine, user_id.c_str(), seed_type, seed_id, seed.c_str());
    if (err != CADENCE_OK) {
        std::cerr << "Error: " << cadence_get_error(engine) << "\n";
        cadence_destroy(engine);
        return 1;
    }

    CadenceQueuedTrack* tracks = nullptr;
    int track_count = 0;
    err = cadence_get_next_tracks(engine, user_id.c_str(), seed_id, count, &tracks, &track_count);
    if (err != CADENCE_OK) {
        std::cerr << "Error: " << cadence_get_error(engine) << "\n";
        cadence_destroy(engine);
        return 1;
    }

    std::cout << "\nRadio queue (" << track_count << " tracks):\n";
    for (int i = 0; i < track_count; ++i) {
        std::cout << "  " << std::setw(2) << (i + 1) << ". "
                  << tracks[i].title << " - " << tracks[i].artist
                  << "  [" << std::fixed << std::setprecision(1) << tracks[i].score << "]\n";
        if (tracks[i].explanation && tracks[i].explanation[0]) {
            std::cout << "      " << tracks[i].explanation << "\n";
        }
    }
    cadence_free_queued_tracks(tracks, track_count);

    if (cadence_save(engine) != CADENCE_OK) {
        std::cerr << "Warning: " << cadence_get_error(engine) << "\n";
    }

    cadence_destroy(engine);
    return 0;
}
