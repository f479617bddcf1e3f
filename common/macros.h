#pragma once

#define LIKELY(x) __builtin_expect(!!(x), 1)
#define UNLIKELY(x) __builtin_expect(!!(x), 0)

// Cache line alignment
#define CACHE_LINE_SIZE 64

#define DELETE_COPY_AND_MOVE(Type)              \
    Type(const Type&) = delete;                 \
    Type& operator=(const Type&) = delete;      \
    Type(Type&&) = delete;                      \
    Type& operator=(Type&&) = delete
