#ifndef AIRKIT_UTILS_ATTRIBUTES_H_
#define AIRKIT_UTILS_ATTRIBUTES_H_

#define ALWAYS_INLINE inline __attribute__((always_inline))

#endif  // AIRKIT_UTILS_ATTRIBUTES_H_
