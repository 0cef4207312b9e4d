#pragma once

int cmd_round(int argc, char** argv);
int cmd_serve(int argc, char** argv);
