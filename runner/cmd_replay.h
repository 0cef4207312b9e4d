#pragma once

int cmd_task(int argc, char** argv);
int cmd_replay(int argc, char** argv);
int cmd_boost(int argc, char** argv);
