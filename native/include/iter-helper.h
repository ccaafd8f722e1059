#ifndef ITER_HELPER_H
#define ITER_HELPER_H

#define foreach(collection, it)						\
	for (auto it = (collection).begin();	\
	     it != (collection).end();					\
		     it++)

#define enumerate(collection, it, i)					\
	for (auto it = ({i = 0; (collection).begin();}); \
	     it != (collection).end();					\
	     it++, i++)

// iterate over a collection of task indices, skipping 'excluded'
#define foreach_task_except(tasks, excluded, task_iter)	\
	foreach(tasks, task_iter)				\
	if (*task_iter != (excluded))

// iterate over the accelerators attached to interconnect 'inter'
#define foreach_accelerator_on(platform, inter, acc_iter)		\
	foreach((platform).get_accelerators(), acc_iter)		\
	if (acc_iter->get_interconnect() == (inter))

#endif
