#pragma once

namespace skill
{
    // Entry points, one per executable. Each returns the process exit status.

    // skill-serve: worker server hosting a named application; PORT required.
    int launch_worker_server(int argc, char **argv);

    // skill-app: the skill application on the development server.
    int launch_app();

    // skill-static: the working directory over plain HTTP, one request at a time.
    int launch_static();
}
