#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <QObject>
#include "testcommon.h"

class HelpersTest : public QObject
{
    Q_OBJECT

private slots:
    void test_helpers_conversions();
    void test_helpers_iso_parsing();
    void test_helpers_label_similarity();
    void test_helpers_overlap_arithmetic();
    void test_helpers_sort_order();
    void test_helpers_names_roundtrip();
};

#endif // TEST_HELPERS_H
