#ifndef TASK_IO_H
#define TASK_IO_H

#include <iostream>

#include "tasks.h"

std::ostream& operator<<(std::ostream &os, const Task &t);
std::ostream& operator<<(std::ostream &os, const TaskSet &ts);
std::ostream& operator<<(std::ostream &os, const Platform &p);

#endif
