#pragma once

#define STRINGIFY_DETAIL(...) #__VA_ARGS__
#define STRINGIFY(...) STRINGIFY_DETAIL(__VA_ARGS__)
