/**
 * voice-analysis: command-line front end for the voice analysis core.
 *
 * Usage:
 *   voice-analysis [--config FILE] <command> [arguments]
 *
 * Commands:
 *   record <title> [description]         Record a take (Enter stops, p pauses, c cancels)
 *   import <file> <title> [description]  Store an existing audio file
 *   list [limit]                         Newest analyses first
 *   show <id>                            One analysis in full
 *   delete <id>                          Remove an analysis and its audio
 *   analyze <id> | --pending             Run language identification
 *   retry <id>                           Move a failed analysis back to pending
 *   feedback <id> <channel> <yes|no>     Rate a prediction
 *   tag <id> <name> / untag <id> <name>  Manage tags
 *   tags                                 List every tag
 *   reconcile                            Finish interrupted saves
 *   sweep                                Delete audio no analysis refers to
 */

#include "AnalysisStore.hpp"
#include "AppConfig.hpp"
#include "AudioConverter.hpp"
#include "AudioRecorder.hpp"
#include "CommandLine.hpp"
#include "Errors.hpp"
#include "FileVault.hpp"
#include "InferenceDispatcher.hpp"
#include "Logging.hpp"
#include "PersistenceCoordinator.hpp"
#include "ProbabilityMapCodec.hpp"
#include "RecordingSession.hpp"
#include "TimeFormat.hpp"
#include "WhisperLanguageDetector.hpp"

#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using va::cli::options;
using va::cli::parse_count;
using va::cli::parse_id;
using va::cli::require_args;

// ============================================================================
// Usage
// ============================================================================

void print_usage(const char* program) {
    std::cout <<
        "Usage: " << program << " [--config FILE] <command> [arguments]\n"
        "\n"
        "Commands:\n"
        "  record <title> [description]         Record a take (Enter stops, p pauses, c cancels)\n"
        "  import <file> <title> [description]  Store an existing audio file\n"
        "  list [limit]                         Newest analyses first\n"
        "  show <id>                            One analysis in full\n"
        "  delete <id>                          Remove an analysis and its audio\n"
        "  analyze <id> | --pending             Run language identification\n"
        "  retry <id>                           Move a failed analysis back to pending\n"
        "  feedback <id> <channel> <yes|no>     Rate a prediction\n"
        "  tag <id> <name>                      Attach a tag\n"
        "  untag <id> <name>                    Detach a tag\n"
        "  tags                                 List every tag\n"
        "  reconcile                            Finish interrupted saves\n"
        "  sweep                                Delete audio no analysis refers to\n";
}

// ============================================================================
// Output
// ============================================================================

void print_summary(const va::AnalysisRecord& r) {
    std::cout << *r.id << "  " << va::to_iso8601(r.creation_date) << "  "
              << va::send_status_to_string(r.send_status) << "  " << r.title;
    if (!r.tags.empty()) {
        std::cout << "  [";
        for (size_t i = 0; i < r.tags.size(); ++i) {
            std::cout << (i ? ", " : "") << r.tags[i].name;
        }
        std::cout << "]";
    }
    std::cout << "\n";
}

std::string describe_duration(const std::string& audio_path) {
    try {
        const double seconds = va::AudioConverter().duration_seconds(audio_path);
        if (seconds < 0) return "-";
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f s", seconds);
        return buf;
    } catch (const va::MediaError& e) {
        va::Log::warn(std::string("Cannot read duration: ") + e.what());
        return "-";
    }
}

void print_record(const va::AnalysisRecord& r) {
    std::cout << "id:          " << *r.id << "\n"
              << "title:       " << r.title << "\n"
              << "description: " << r.description.value_or("") << "\n"
              << "status:      " << va::send_status_to_string(r.send_status) << "\n";
    if (r.error_message) {
        std::cout << "error:       " << *r.error_message << "\n";
    }
    std::cout << "audio:       " << r.audio_path << "\n"
              << "duration:    " << describe_duration(r.audio_path) << "\n"
              << "created:     " << va::to_iso8601(r.creation_date) << "\n"
              << "completed:   "
              << (r.completion_date ? va::to_iso8601(*r.completion_date) : "-") << "\n";

    for (va::Channel c : va::kAllChannels) {
        const auto& ch = r.channel(c);
        std::cout << "  " << va::channel_to_string(c) << ": "
                  << va::ProbabilityMapCodec::encode(ch.prediction).value_or("-");
        if (ch.feedback) std::cout << "  (feedback: " << (*ch.feedback ? "yes" : "no") << ")";
        std::cout << "\n";
    }

    std::cout << "tags:       ";
    for (const auto& t : r.tags) std::cout << " " << t.name;
    std::cout << "\n";
}

// ============================================================================
// Commands
// ============================================================================

int run_record(const options& opts, const va::AppConfig& config,
               va::PersistenceCoordinator& coordinator) {
    require_args(opts, 1, 2);

    va::AudioRecorder::Options rec_opts;
    rec_opts.input_format = config.capture_input_format;
    rec_opts.device       = config.capture_device;
    va::AudioRecorder recorder(rec_opts);

    va::RecordingSession session(recorder, coordinator, config.session_config());
    session.set_observer([](va::SessionState state, std::chrono::milliseconds remaining) {
        std::cout << "\r" << va::session_state_to_string(state) << "  "
                  << (remaining.count() + 999) / 1000 << " s left   " << std::flush;
    });

    if (!session.start()) {
        std::cerr << "Cannot start recording: " << session.last_error().value_or("unknown") << "\n";
        return 1;
    }

    // Poll stdin so the countdown can end the take on its own.
    while (session.state() == va::SessionState::recording ||
           session.state() == va::SessionState::paused) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        if (poll(&pfd, 1, 200) <= 0 || !(pfd.revents & POLLIN)) continue;

        std::string line;
        if (!std::getline(std::cin, line)) {
            session.stop();
            break;
        }
        if (line == "p") {
            if (!session.pause()) session.resume();
        } else if (line == "c") {
            session.cancel();
        } else {
            session.stop();
        }
    }
    std::cout << "\n";

    if (session.state() != va::SessionState::completed) {
        std::cout << "Recording discarded.\n";
        return session.state() == va::SessionState::discarded ? 0 : 1;
    }

    std::optional<std::string> description;
    if (opts.args.size() > 1) description = opts.args[1];

    // The session keeps the take across failed saves, so offer a retry
    // before it goes out of scope.
    for (;;) {
        try {
            const auto record = session.save(opts.args[0], description);
            std::cout << "Saved analysis " << *record.id << "\n";
            return 0;
        } catch (const va::Error& e) {
            std::cerr << "Save failed: " << e.what() << "\n";
            va::Log::error(std::string("Save failed: ") + e.what());
        }

        std::cout << "Retry saving? [Y/n] " << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer) || answer == "n" || answer == "N") break;
    }

    const std::string kept = session.release_recording();
    std::cerr << "Recording kept at " << kept << "\n"
              << "Use 'voice-analysis import " << kept << " <title>' to save it later.\n";
    return 1;
}

int run_import(const options& opts, va::PersistenceCoordinator& coordinator) {
    require_args(opts, 2, 3);
    std::optional<std::string> description;
    if (opts.args.size() > 2) description = opts.args[2];

    const auto record = coordinator.create_analysis(opts.args[1], description, opts.args[0]);
    std::cout << "Imported analysis " << *record.id << " -> " << record.audio_path << "\n";
    return 0;
}

int run_analyze(const options& opts, const va::AppConfig& config,
                va::PersistenceCoordinator& coordinator) {
    require_args(opts, 1, 1);

    va::WhisperLanguageDetector detector(config.language_top_n);
    if (!detector.init(config.whisper_model_path)) {
        std::cerr << "Cannot load whisper model " << config.whisper_model_path << "\n";
        return 1;
    }

    va::InferenceDispatcher dispatcher(coordinator, detector);
    dispatcher.set_completion_callback([](int64_t id, bool success, const std::string& error) {
        if (success) std::cout << "Analysis " << id << ": done\n";
        else std::cout << "Analysis " << id << ": failed: " << error << "\n";
    });

    if (opts.args[0] == "--pending") {
        dispatcher.start();
        const size_t queued = dispatcher.recover_pending();
        std::cout << "Analysing " << queued << " pending recording(s)\n";
        dispatcher.stop();
        return 0;
    }

    return dispatcher.process(parse_id(opts.args[0])) ? 0 : 1;
}

int dispatch(const options& opts, const va::AppConfig& config,
             va::PersistenceCoordinator& coordinator) {
    const std::string& cmd = opts.command;

    if (cmd == "record") return run_record(opts, config, coordinator);
    if (cmd == "import") return run_import(opts, coordinator);
    if (cmd == "analyze") return run_analyze(opts, config, coordinator);

    if (cmd == "list") {
        require_args(opts, 0, 1);
        const size_t limit = opts.args.empty() ? 20 : parse_count(opts.args[0]);
        for (const auto& r : coordinator.recent(limit)) print_summary(r);
        return 0;
    }
    if (cmd == "show") {
        require_args(opts, 1, 1);
        const auto record = coordinator.get_analysis_by_id(parse_id(opts.args[0]));
        if (!record) {
            std::cerr << "No analysis " << opts.args[0] << "\n";
            return 1;
        }
        print_record(*record);
        return 0;
    }
    if (cmd == "delete") {
        require_args(opts, 1, 1);
        if (!coordinator.delete_analysis(parse_id(opts.args[0]))) {
            std::cerr << "No analysis " << opts.args[0] << "\n";
            return 1;
        }
        return 0;
    }
    if (cmd == "retry") {
        require_args(opts, 1, 1);
        coordinator.retry_analysis(parse_id(opts.args[0]));
        return 0;
    }
    if (cmd == "feedback") {
        require_args(opts, 3, 3);
        const auto channel = va::channel_from_string(opts.args[1]);
        if (!channel) throw va::ValidationError("Unknown channel '" + opts.args[1] + "'");
        const std::string& verdict = opts.args[2];
        if (verdict != "yes" && verdict != "no") {
            throw va::ValidationError("Feedback must be 'yes' or 'no'");
        }
        coordinator.set_feedback(parse_id(opts.args[0]), *channel, verdict == "yes");
        return 0;
    }
    if (cmd == "tag" || cmd == "untag") {
        require_args(opts, 2, 2);
        const int64_t id = parse_id(opts.args[0]);
        const bool changed = cmd == "tag" ? coordinator.add_tag(id, opts.args[1])
                                          : coordinator.remove_tag(id, opts.args[1]);
        if (!changed) std::cout << "Nothing changed\n";
        return 0;
    }
    if (cmd == "tags") {
        require_args(opts, 0, 0);
        for (const auto& t : coordinator.all_tags()) std::cout << t.id << "  " << t.name << "\n";
        return 0;
    }
    if (cmd == "reconcile") {
        require_args(opts, 0, 0);
        std::cout << "Reconciled " << coordinator.reconcile_all() << " analyses\n";
        return 0;
    }
    if (cmd == "sweep") {
        require_args(opts, 0, 0);
        std::cout << "Removed " << coordinator.sweep_orphaned_directories()
                  << " orphaned directories\n";
        return 0;
    }

    throw va::ValidationError("Unknown command '" + cmd + "' (see --help)");
}

} // namespace

// ============================================================================
// main
// ============================================================================

int main(int argc, char* argv[]) {
    const auto opts = va::cli::parse_arguments(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return argc > 1 ? 0 : 2;
    }

    int rc = 1;
    try {
        const va::AppConfig config = va::AppConfig::load(opts->config_path);
        va::Log::initialize(config.log_config());

        va::AnalysisStore store(config.database_path);
        store.open();
        va::FileVault vault(config.vault_locations());
        va::PersistenceCoordinator coordinator(store, vault);

        // Finish whatever an earlier run left half-saved.
        coordinator.reconcile_all();

        rc = dispatch(*opts, config, coordinator);
    } catch (const va::Error& e) {
        std::cerr << "error: " << e.what() << "\n";
        rc = 1;
    }

    va::Log::shutdown();
    return rc;
}
