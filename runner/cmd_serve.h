#pragma once

// hostlink_cli serve [--host H] [--port P] [--allow IPS] [--workers N]
//                    [--timeout_ms MS] [--audit PATH] [-- <server argv...>]
int cmd_serve(int argc, char** argv);
