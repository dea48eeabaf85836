// -----------------------------------------------------------------------------
// frnm — Command-line handling
// -----------------------------------------------------------------------------
#include "frnm.h"

#include <cstdio>
#include <cstring>
#include <getopt.h>
#include <string>
#include <vector>

static void usage(FILE* out, const char* prog) {
    fprintf(out, "Usage: %s [-h] [-V] [-s] [-q] [-r] [-c CHAR] FILES [FILES ...]\n", prog);
}

static void show_help(FILE* out, const char* prog) {
    usage(out, prog);
    fprintf(out, "\n"
                 "Renames files and folders by replacing spaces and other unconventional\n"
                 "characters in their names with a substitution character. The characters\n"
                 "considered conventional are: %s. Any run of characters outside\n"
                 "that set is replaced by a single substitution character.\n"
                 "\n"
                 "A file is not renamed if:\n"
                 "    - its name is already standard, i.e. it contains none of the excluded\n"
                 "      characters.\n"
                 "    - its basename (stripped of the extension) would be left with fewer\n"
                 "      than two words.\n"
                 "\n"
                 "positional arguments:\n"
                 "  FILES                  pathnames of files/folders to be renamed\n"
                 "\n"
                 "options:\n"
                 "  -h, --help             show this help message and exit\n"
                 "  -V, --version          show the version and exit\n"
                 "  -s, --suppress-errors  skip entries that fail and keep going; exit non-zero\n"
                 "  -q, --quiet            do not display the rename operation of file(s)\n"
                 "  -r, --recursive        rename recursively, deepest entries first\n"
                 "  -c, --char CHAR        the substitution character (default: $FRNM_CHAR or _)\n"
                 "\n"
                 "environment:\n"
                 "  FRNM_CHAR, FRNM_LOG_LEVEL (off|error|warn|info|debug),\n"
                 "  FRNM_USE_SYSLOG, FRNM_AUDIT_LOG\n",
                 constants::ALLOWED_CHARS_DESC);
}

int frnm_cli_run(int argc, char* argv[], FILE* out, FILE* err) {
    const char* prog = argc > 0 ? argv[0] : "frnm";

    auto cfg = frnm_load_config_from_env();
    if (!cfg) {
        fprintf(err, "%s: error: invalid environment configuration\n", prog);
        return 2;
    }

    frnm_log_configure(cfg->log_level, cfg->use_syslog);

    std::string sub = cfg->substitution_char;
    RenameOptions opts;
    opts.out = out;
    opts.audit_log_path = cfg->audit_log_path;

    static const struct option long_opts[] = {
        {"char",            required_argument, nullptr, 'c'},
        {"recursive",       no_argument,       nullptr, 'r'},
        {"quiet",           no_argument,       nullptr, 'q'},
        {"suppress-errors", no_argument,       nullptr, 's'},
        {"help",            no_argument,       nullptr, 'h'},
        {"version",         no_argument,       nullptr, 'V'},
        {nullptr, 0, nullptr, 0},
    };

    // Full reinitialization, so repeated runs in one process parse afresh
    optind = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "c:rqshV", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'c': sub = optarg; break;
            case 'r': opts.recursive = true; break;
            case 'q': opts.verbose = false; break;
            case 's': opts.suppress_errors = true; break;
            case 'h':
                show_help(out, prog);
                return 0;
            case 'V':
                fprintf(out, "frnm %s\n", FRNM_VERSION);
                return 0;
            default:
                usage(err, prog);
                return 2;
        }
    }

    if (optind >= argc) {
        usage(err, prog);
        fprintf(err, "%s: error: the following arguments are required: FILES\n", prog);
        return 2;
    }

    std::vector<std::string> files(argv + optind, argv + argc);

    FRNM_LOG_DEBUG("frnm", "Starting: char '%s', %zu input(s), recursive %s, log level %s",
                   sub.c_str(), files.size(), opts.recursive ? "yes" : "no",
                   frnm_log_level_name(frnm_log_level()));

    FrnmStatus status = frnm_rename_entries(sub, files, opts);
    if (status.ok()) return 0;

    if (!opts.suppress_errors) {
        fprintf(err, "%s: error: %s\n", prog, status.message.c_str());
    }
    return 1;
}
