// main.cpp
//
// Ongoing process state reconstruction:
//   - BPMN parsing (tasks, gateways, events, sequence flows) via TinyXML2
//   - Explicit reachability graph over flow markings (BFS)
//   - N-gram index mapping executed activity prefixes to markings
//   - Directly-follows concurrency oracle for enablement times
//   - Per-case state: flows, ongoing, enabled activities and gateways
//
// Usage:
//   process_state <model.bpmn> <event_log.csv> [--column-mapping JSON]
//       [--start-time TS] [--n-gram-limit N] [--max-states N] [--max-depth N]
//       [--output FILE] [--print-model]
//
// -----------------------------------------------------------------------------

#include "bpmn_handler.hpp"
#include "concurrency_oracle.hpp"
#include "event_log.hpp"
#include "n_gram_index.hpp"
#include "profiler.hpp"
#include "reachability_graph.hpp"
#include "state_computer.hpp"
#include "state_output.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>

using namespace std;

// ---------------------------
// Command-line parsing helpers
// ---------------------------

struct CLI {
    string bpmn;
    string event_log;
    string column_mapping;
    string start_time;
    string output = "output.json";
    size_t n_gram_limit = 5;
    AnalysisConfig analysis;
    bool print_model = false;
};

static void print_usage(const char* program) {
    cerr << "Usage: " << program << " <model.bpmn> <event_log.csv> [--column-mapping JSON]"
         << " [--start-time TS] [--n-gram-limit N] [--max-states N] [--max-depth N]"
         << " [--output FILE] [--print-model]\n";
}

static CLI parse_cli(int argc, char** argv) {
    CLI cli;
    int positional = 0;
    auto value = [&](int& i, const string& flag) -> string {
        if (i+1 >= argc) throw runtime_error("Missing value for " + flag);
        return argv[++i];
    };
    for (int i=1;i<argc;i++) {
        string a = argv[i];
        if (a == "--column-mapping") cli.column_mapping = value(i, a);
        else if (a == "--start-time") cli.start_time = value(i, a);
        else if (a == "--output") cli.output = value(i, a);
        else if (a == "--n-gram-limit") cli.n_gram_limit = stoul(value(i, a));
        else if (a == "--max-states") cli.analysis.MAX_STATES = stoul(value(i, a));
        else if (a == "--max-depth") cli.analysis.MAX_DEPTH = stoul(value(i, a));
        else if (a == "--print-model") cli.print_model = true;
        else if (a.rfind("--", 0) == 0) throw runtime_error("Unknown option " + a);
        else if (positional == 0) { cli.bpmn = a; ++positional; }
        else if (positional == 1) { cli.event_log = a; ++positional; }
        else throw runtime_error("Unexpected argument " + a);
    }
    return cli;
}

// ---------------------------
// Main
// ---------------------------

int main(int argc, char** argv) {
    try {
        CLI cli = parse_cli(argc, argv);
        if (cli.bpmn.empty() || cli.event_log.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        double t_total = 0.0;

        // --- Parse BPMN
        Stopwatch sw_parse; sw_parse.start();
        BPMNHandler model = BPMNHandler::from_file(cli.bpmn);
        double dt_parse = sw_parse.stop();
        t_total += dt_parse;
        cout << "Parsed BPMN successfully: "
             << model.activities().size() << " activities, "
             << model.nodes().size() - model.activities().size() << " gateways/events, "
             << model.sequence_flows().size() << " sequence flows.\n";
        print_time("Parse BPMN", dt_parse);
        print_mem_now("(after parse)");

        if (cli.print_model) model.print_structure();

        // --- Reachability graph
        Stopwatch sw_graph; sw_graph.start();
        ReachabilityResult R = build_reachability_graph(model, cli.analysis);
        double dt_graph = sw_graph.stop();
        t_total += dt_graph;
        cout << "Reachable markings: " << R.graph.markings.size()
             << "  | edges: " << R.graph.edges.size()
             << "  | explored nodes: " << R.explored
             << "  | finished=" << (R.finished ? "yes" : "no (hit limits)") << "\n";
        if (!R.finished) {
            cout << "[WARN] Reachability exploration stopped at --max-states " << cli.analysis.MAX_STATES
                 << " / --max-depth " << cli.analysis.MAX_DEPTH << ". States of deeper cases may be missed.\n";
        }
        print_time("Reachability graph", dt_graph);
        print_mem_now("(after reachability graph)");

        // --- N-gram index
        Stopwatch sw_index; sw_index.start();
        unordered_map<string, string> labels(model.activities().begin(), model.activities().end());
        NGramIndex n_gram_index(R.graph, std::move(labels), cli.n_gram_limit);
        n_gram_index.build();
        double dt_index = sw_index.stop();
        t_total += dt_index;
        cout << "Indexed n-grams: " << n_gram_index.size() << " (limit " << cli.n_gram_limit << ")\n";
        print_time("N-gram index", dt_index);

        // --- Event log
        Stopwatch sw_log; sw_log.start();
        EventLogIDs ids = parse_column_mapping(cli.column_mapping);
        vector<Event> events = read_event_log(cli.event_log, ids);
        if (!cli.start_time.empty()) {
            auto cut = parse_timestamp(cli.start_time);
            if (!cut) throw runtime_error("Invalid --start-time " + cli.start_time);
            size_t before = events.size();
            events = cut_event_log(events, *cut);
            cout << "[info] Log cut at " << format_timestamp(*cut) << ": kept "
                 << events.size() << " of " << before << " events.\n";
        }
        double dt_log = sw_log.stop();
        t_total += dt_log;
        LogStats stats = basic_log_stats(events);
        cout << "Event log: " << stats.cases << " cases, " << stats.events << " events"
             << ", earliest start " << (stats.earliest_start ? format_timestamp(*stats.earliest_start) : "-")
             << ", latest end " << (stats.latest_end ? format_timestamp(*stats.latest_end) : "-") << "\n";
        print_time("Read event log", dt_log);

        // --- Case states
        Stopwatch sw_state; sw_state.start();
        DirectlyFollowsConcurrencyOracle oracle(events);
        StateComputer computer(n_gram_index, R.graph, model, oracle);
        CaseStates states = computer.compute_case_states(events);
        double dt_state = sw_state.stop();
        t_total += dt_state;
        cout << "Case states: " << states.size() << " of " << stats.cases << " cases"
             << " (" << stats.cases - states.size() << " left out with an enabled end event)\n";
        print_time("Compute case states", dt_state);
        print_mem_now("(after case states)");

        write_case_states(states, cli.output);
        cout << "Wrote " << cli.output << "\n";

        cout << "\n[time] TOTAL: " << fmt_ms(t_total) << " ms\n";
        print_mem_now("FINAL");
        cout << "\nDone.\n";
    } catch (const std::exception& e) {
        cerr << "\nFATAL ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
