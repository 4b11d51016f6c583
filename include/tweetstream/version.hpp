#pragma once

#define TWEETSTREAM_VERSION_MAJOR 0
#define TWEETSTREAM_VERSION_MINOR 1
#define TWEETSTREAM_VERSION_PATCH 0
#define TWEETSTREAM_VERSION "0.1.0"
