#pragma once

#define BEGIN_NAMESPACE(name) namespace name {
#define END_NAMESPACE(name) }
