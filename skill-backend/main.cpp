#include "launcher.hpp"

// SKILL_LAUNCH_VARIANT is fixed per executable by the build:
// 1 = skill-serve, 2 = skill-app, 3 = skill-static.
#ifndef SKILL_LAUNCH_VARIANT
#define SKILL_LAUNCH_VARIANT 1
#endif

int main(int argc, char **argv)
{
#if SKILL_LAUNCH_VARIANT == 1
    return skill::launch_worker_server(argc, argv);
#elif SKILL_LAUNCH_VARIANT == 2
    (void)argc;
    (void)argv;
    return skill::launch_app();
#else
    (void)argc;
    (void)argv;
    return skill::launch_static();
#endif
}
