#pragma once

/*here you can choose the splice store backend*/

#define MS_STORE_VECTOR 1
#define MS_STORE_TREE   2

#ifndef MS_STORE
#define MS_STORE MS_STORE_VECTOR
#endif

#if MS_STORE == MS_STORE_VECTOR
#define MS_STORE_NAME "vector"
#elif MS_STORE == MS_STORE_TREE
#define MS_STORE_NAME "tree"
#else
#define MS_STORE_NAME "unknown"
#endif
