#pragma once

namespace trendloop::cli {

// Routes `trendloop` subcommands and returns process exit codes following
// core::errors::ExitCode:
//   0  => run completed / command succeeded
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => pipeline file invalid
//   20/30/31 => run aborted (snapshot / safety / timeout)
//   40 => another run is active
int Dispatch(int argc, char** argv);

} // namespace trendloop::cli
