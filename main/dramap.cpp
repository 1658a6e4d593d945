/*
 *  author: Suhas Vittal
 *  date:   19 October 2026
 * */

#include <defs.h>

#include <mapping/decoder.h>
#include <mapping/parser.h>
#include <tool/drama.h>
#include <tool/report.h>

#include <utils/argparse.h>

#include <iostream>
#include <sstream>
#include <vector>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

constexpr std::string_view NONE = "none";

constexpr int EXIT_BAD_ARGS = 1;
constexpr int EXIT_NO_REPORT = 2;
constexpr int EXIT_MISSING_FIELD = 3;

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

void print_config(void);
void print_announcement(std::string);

std::vector<uint64_t>       split_addresses(const std::string&);
std::vector<std::string>    split_params(const std::string&);

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

std::string OPT_addr_;
std::string OPT_report_file_;
std::string OPT_drama_dir_;
std::string OPT_target_;
std::string OPT_args_;
std::string OPT_labels_;
bool        OPT_strict_;
bool        OPT_verbose_;

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

int main(int argc, char* argv[]) {
    std::ios_base::sync_with_stdio(false);
    /*
     * Parse arguments:
     * */
    ArgParseResult ARGS = parse_args(argc, argv,
            { // REQUIRED
                "addr",
            },
            { // OPTIONAL
                { "report", "Saved DRAMA report (plain or gzip)", NONE },
                { "drama", "DRAMA checkout to build and run", DRAMA_DEFAULT_DIR },
                { "target", "make target used to build DRAMA", DRAMA_MAKE_TARGET },
                { "args", "Arguments passed to DRAMA (or use -- ...)", NONE },
                { "labels", "Report labels (Label=field,...)", "Row=row,Column=column,Bank=bank" },
                { "strict", "Fail if a field is missing", "" },
                { "verbose", "Log each pipeline step", "" }
            });
    ARGS("addr", OPT_addr_);
    ARGS("report", OPT_report_file_);
    ARGS("drama", OPT_drama_dir_);
    ARGS("target", OPT_target_);
    ARGS("args", OPT_args_);
    ARGS("labels", OPT_labels_);
    ARGS("strict", OPT_strict_);
    ARGS("verbose", OPT_verbose_);

    std::vector<uint64_t> addresses = split_addresses(OPT_addr_);

    LabelVocabulary vocab;
    if (!parse_vocabulary(OPT_labels_, vocab)) {
        exit(EXIT_BAD_ARGS);
    }
    MissingFieldPolicy policy = OPT_strict_ ? MissingFieldPolicy::ERROR : MissingFieldPolicy::ZERO_FILL;

    print_config();
    /*
     * Get the report, either from disk or from a fresh DRAMA run.
     * */
    std::string report;
    AcquireStatus status;
    if (OPT_report_file_ != NONE) {
        status = read_report_file(OPT_report_file_, report);
    } else {
        DRAMATool tool(OPT_drama_dir_);
        tool.verbose_ = OPT_verbose_;
        std::vector<std::string> params;
        if (OPT_args_ != NONE) params = split_params(OPT_args_);
        // Arguments after "--" keep their quoting.
        params.insert(params.end(), ARGS.trailing_.begin(), ARGS.trailing_.end());
        status = tool.run_pipeline(report, params, OPT_target_);
    }
    if (status != AcquireStatus::OK) {
        std::cerr << "Could not obtain DRAMA report: " << acquire_status_name(status) << "\n";
        exit(EXIT_NO_REPORT);
    }
    /*
     * Build the decoder.
     * */
    FieldMapping mapping = parse_mapping(report, vocab);
    print_mapping(std::cout, mapping);
    std::cout << "\n";

    AddressDecoder dec;
    std::vector<std::string> missing;
    if (make_decoder(mapping, dec, policy, default_field_order(), &missing) != DecoderStatus::OK) {
        std::cerr << "Report is missing fields:";
        for (const std::string& f : missing) std::cerr << " " << f;
        std::cerr << "\n";
        exit(EXIT_MISSING_FIELD);
    }
    if (OPT_verbose_) {
        dec.print_config(std::cout);
    }

    print_announcement("DECODED ADDRESSES");

    for (uint64_t addr : addresses) {
        std::cout << FMT_HEX(addr) << " ->";
        bool first = true;
        for (const DecodedField& f : dec.decode_fields(addr)) {
            std::cout << (first ? " " : ", ") << f.name << ": " << f.value;
            first = false;
        }
        std::cout << "\n";
    }
    std::cout.flush();
    return 0;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

std::vector<uint64_t>
split_addresses(const std::string& s) {
    std::vector<uint64_t> out;
    std::stringstream ss(s);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
        try {
            out.push_back( static_cast<uint64_t>(parse_unsigned(tok)) );
        } catch (const std::logic_error&) {
            std::cerr << "Could not parse address \"" << tok << "\".\n";
            exit(EXIT_BAD_ARGS);
        }
    }
    if (out.empty()) {
        std::cerr << "No addresses given.\n";
        exit(EXIT_BAD_ARGS);
    }
    return out;
}

std::vector<std::string>
split_params(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string tok;
    while (ss >> tok) out.push_back(tok);
    return out;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

template <class T>
inline void list(std::string name, T value) {
    std::cout << std::setw(24) << std::left << name << ":\t" << value << "\n";
}

void
print_config() {
    std::cout << "\n---------------------------------------------\n\n";

    list("ADDRESSES", OPT_addr_);
    if (OPT_report_file_ != NONE) {
        list("REPORT", OPT_report_file_);
    } else {
        list("DRAMA_DIR", OPT_drama_dir_);
        list("MAKE_TARGET", OPT_target_);
        list("DRAMA_ARGS", OPT_args_);
    }

    std::cout << "\n---------------------------------------------\n\n";

    list("LABELS", OPT_labels_);
    list("MISSING_FIELD_POLICY", missing_field_policy_name(
                OPT_strict_ ? MissingFieldPolicy::ERROR : MissingFieldPolicy::ZERO_FILL));

    std::cout << "\n---------------------------------------------\n\n";
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

inline std::string
get_bar(size_t n) {
    std::stringstream ss;
    while (n--) ss << "-";
    return ss.str();
}

void
print_announcement(std::string a) {
    constexpr size_t BAR_SIZE = 80;
    std::string full_bar = get_bar(BAR_SIZE);
    std::string half_bar = get_bar( (BAR_SIZE-a.size())/2 - 1 );

    std::cout << "\n" << full_bar
                << "\n" << half_bar << " " << a << " " << half_bar
                << "\n" << full_bar << "\n\n";
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
