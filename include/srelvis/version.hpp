#ifndef SRELVIS_VERSION_HPP
#define SRELVIS_VERSION_HPP

#define SRELVIS_VERSION "0.3.0"

#endif // SRELVIS_VERSION_HPP
