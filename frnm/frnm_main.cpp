// -----------------------------------------------------------------------------
// frnm — Entry point
// -----------------------------------------------------------------------------
#include "frnm.h"

#include <cstdio>

int main(int argc, char* argv[]) {
    return frnm_cli_run(argc, argv, stdout, stderr);
}
