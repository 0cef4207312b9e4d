#pragma once

int cmd_admit(int argc, char** argv);
int cmd_verify(int argc, char** argv);
int cmd_evaluate(int argc, char** argv);
int cmd_pack(int argc, char** argv);
int cmd_blacklist(int argc, char** argv);
